#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <providers/apt.hpp>
#include <providers/dnf.hpp>
#include <providers/freebsd_pkg.hpp>
#include <providers/openbsd_pkg.hpp>
#include <providers/provider_factory.hpp>
#include "fake_connection.hpp"

class ProviderTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    FakeConnection cx{remote};
};

// ── Registry ────────────────────────────────────────────────

TEST(ProviderFactory, BuiltinsRegistered) {
    for (const char* name : {"apt", "dnf", "yum", "pkg", "pkg_add"}) {
        EXPECT_TRUE(ProviderFactory::has_provider(name)) << name;
        EXPECT_EQ(ProviderFactory::create(name)->info().name, name);
    }
}

TEST(ProviderFactory, UnknownThrows) {
    EXPECT_THROW(ProviderFactory::create("pacman"), ConfigurationError);
}

TEST(ProviderFactory, PrivilegeMetadataWithoutInvocation) {
    auto registry = ProviderFactory::registry();
    ASSERT_TRUE(registry.count("apt"));
    EXPECT_TRUE(registry["apt"].reposync_requires_sudo);
    EXPECT_FALSE(registry["apt"].get_updates_requires_sudo);
    EXPECT_FALSE(registry["dnf"].reposync_requires_sudo);
}

TEST(ProviderFactory, CustomRegistration) {
    ProviderFactory::register_provider("test_noop", [] {
        return std::make_unique<OpenBSDPkgProvider>();
    });
    EXPECT_TRUE(ProviderFactory::has_provider("test_noop"));
    EXPECT_NE(ProviderFactory::create("test_noop"), nullptr);
}

// ── apt ─────────────────────────────────────────────────────

TEST(AptParse, SecurityFromSource) {
    auto u = AptProvider::parse_line(
        "Inst libssl3 [3.0.2-0ubuntu1.14] (3.0.2-0ubuntu1.15 Ubuntu:22.04/jammy-security [amd64])");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->name, "libssl3");
    EXPECT_EQ(u->current_version, "3.0.2-0ubuntu1.14");
    EXPECT_EQ(u->new_version, "3.0.2-0ubuntu1.15");
    EXPECT_EQ(u->source, "Ubuntu:22.04/jammy-security");
    EXPECT_TRUE(u->security);
}

TEST(AptParse, RegularUpdate) {
    auto u = AptProvider::parse_line(
        "Inst curl [7.81.0-1ubuntu1.15] (7.81.0-1ubuntu1.16 Ubuntu:22.04/jammy-updates [amd64])");
    ASSERT_TRUE(u.has_value());
    EXPECT_FALSE(u->security);
}

TEST(AptParse, NewPackageWithoutCurrentVersion) {
    EXPECT_FALSE(AptProvider::parse_line(
        "Inst linux-image-6.5 (6.5.0-28.29 Ubuntu:22.04/jammy-updates [amd64])").has_value());
}

TEST_F(ProviderTest, AptUpdatesFilterInstLines) {
    remote->on("apt-get dist-upgrade -s", ok_result(
        "Reading package lists...\n"
        "Calculating upgrade...\n"
        "Inst curl [7.81.0-1ubuntu1.15] (7.81.0-1ubuntu1.16 Ubuntu:22.04/jammy-updates [amd64])\n"
        "Conf curl (7.81.0-1ubuntu1.16 Ubuntu:22.04/jammy-updates [amd64])\n"));
    AptProvider apt;
    auto updates = apt.get_updates(cx);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].name, "curl");
}

TEST_F(ProviderTest, AptNothingPending) {
    remote->on("apt-get dist-upgrade -s", ok_result("0 upgraded, 0 newly installed\n"));
    AptProvider apt;
    EXPECT_TRUE(apt.get_updates(cx).empty());
}

TEST_F(ProviderTest, AptFailureCarriesOutput) {
    remote->on("apt-get dist-upgrade -s", exit_result(100, "", "E: Could not get lock"));
    AptProvider apt;
    try {
        apt.get_updates(cx);
        FAIL() << "expected DataRefreshError";
    } catch (const DataRefreshError& e) {
        EXPECT_EQ(e.stderr_data(), "E: Could not get lock");
    }
}

TEST_F(ProviderTest, AptReposyncFailureReturnsFalse) {
    remote->on("sudo -n /usr/bin/apt-get update", exit_result(1, "", "sudo: a password is required"));
    AptProvider apt;
    EXPECT_FALSE(apt.reposync(cx));
}

// ── dnf / yum ───────────────────────────────────────────────

TEST(DnfParse, StopsAtObsoleting) {
    auto rows = DnfProvider::parse_check_update(
        "\n"
        "kernel.x86_64          5.14.0-362.24.1.el9_3    baseos\n"
        "openssl.x86_64         1:3.0.7-25.el9_3         baseos\n"
        "Obsoleting Packages\n"
        "grub2-tools.x86_64     1:2.06-70.el9_3          baseos\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(std::get<0>(rows[1]), "openssl.x86_64");
    EXPECT_EQ(std::get<1>(rows[1]), "1:3.0.7-25.el9_3");
    EXPECT_EQ(std::get<2>(rows[1]), "baseos");
}

TEST_F(ProviderTest, DnfUpdatesWithSecurityAndInstalled) {
    remote->on("dnf check-update --security --quiet",
               exit_result(100, "openssl.x86_64  1:3.0.7-25.el9_3  baseos\n"));
    remote->on("dnf check-update --quiet",
               exit_result(100,
                           "kernel.x86_64   5.14.0-362.24.1.el9_3  baseos\n"
                           "openssl.x86_64  1:3.0.7-25.el9_3       baseos\n"));
    remote->on("dnf list installed --quiet kernel.x86_64 openssl.x86_64",
               ok_result("Installed Packages\n"
                         "kernel.x86_64   5.14.0-362.8.1.el9_3   @baseos\n"
                         "kernel.x86_64   5.14.0-362.18.1.el9_3  @baseos\n"
                         "openssl.x86_64  1:3.0.7-24.el9         @baseos\n"));

    DnfProvider dnf;
    auto updates = dnf.get_updates(cx);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].name, "kernel.x86_64");
    EXPECT_EQ(updates[0].current_version, "5.14.0-362.18.1.el9_3 (+)");
    EXPECT_FALSE(updates[0].security);
    EXPECT_EQ(updates[1].current_version, "1:3.0.7-24.el9");
    EXPECT_TRUE(updates[1].security);
}

TEST_F(ProviderTest, DnfNoUpdates) {
    remote->on("dnf check-update --security --quiet", ok_result());
    remote->on("dnf check-update --quiet", ok_result());
    DnfProvider dnf;
    EXPECT_TRUE(dnf.get_updates(cx).empty());
}

TEST_F(ProviderTest, DnfUnexpectedExitThrows) {
    remote->on("dnf check-update --security --quiet", ok_result());
    remote->on("dnf check-update --quiet", exit_result(1, "", "Error: Failed to download metadata"));
    DnfProvider dnf;
    EXPECT_THROW(dnf.get_updates(cx), DataRefreshError);
}

TEST_F(ProviderTest, YumUsesYumBinary) {
    remote->on("yum makecache --quiet", ok_result());
    DnfProvider yum(DnfProvider::Flavor::Yum);
    EXPECT_TRUE(yum.reposync(cx));
    EXPECT_EQ(yum.info().name, "yum");
}

// ── FreeBSD pkg ─────────────────────────────────────────────

TEST_F(ProviderTest, FreeBSDUpdatesMarkVulnerable) {
    remote->on("pkg audit -q", exit_result(1, "curl-8.4.0\n"));
    remote->on("pkg upgrade -qn", exit_result(1,
        "The following 2 package(s) will be affected:\n"
        "\n"
        "Installed packages to be UPGRADED:\n"
        "\tcurl: 8.4.0 -> 8.6.0\n"
        "\tgit: 2.43.0 -> 2.44.0\n"
        "\n"
        "Number of packages to be upgraded: 2\n"));

    FreeBSDPkgProvider pkg;
    auto updates = pkg.get_updates(cx);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].name, "curl");
    EXPECT_TRUE(updates[0].security);
    EXPECT_EQ(updates[1].name, "git");
    EXPECT_FALSE(updates[1].security);
    EXPECT_EQ(updates[1].source, "Packages Mirror");
}

TEST_F(ProviderTest, FreeBSDAuditErrorThrows) {
    remote->on("pkg audit -q", exit_result(3, "", "pkg: vulnxml file could not be fetched"));
    FreeBSDPkgProvider pkg;
    EXPECT_THROW(pkg.get_updates(cx), DataRefreshError);
}

TEST_F(ProviderTest, FreeBSDReposyncIsNoop) {
    FreeBSDPkgProvider pkg;
    EXPECT_TRUE(pkg.reposync(cx));
    EXPECT_TRUE(remote->commands.empty());
}

// ── OpenBSD pkg_add ─────────────────────────────────────────

TEST(OpenBSDParse, Candidate) {
    auto u = OpenBSDPkgProvider::parse_line("Update candidates: curl-8.5.0 -> curl-8.6.0");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->name, "curl");
    EXPECT_EQ(u->current_version, "8.5.0");
    EXPECT_EQ(u->new_version, "8.6.0");
    EXPECT_FALSE(u->security);
}

TEST(OpenBSDParse, SameVersionSkipped) {
    EXPECT_FALSE(OpenBSDPkgProvider::parse_line(
        "Update candidates: quirks-7.14 -> quirks-7.14").has_value());
}

TEST_F(ProviderTest, OpenBSDFailureThrows) {
    remote->on("/usr/sbin/pkg_add -u -v -x -n", exit_result(1, "", "pkg_add: no PKG_PATH"));
    OpenBSDPkgProvider pkg;
    EXPECT_THROW(pkg.get_updates(cx), DataRefreshError);
}
