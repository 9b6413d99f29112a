#include "platform.hpp"
#include <csignal>
#include <cstdlib>

namespace fs = std::filesystem;

namespace platform {

namespace {
std::atomic<bool>* interrupt_flag = nullptr;

void on_sigint(int) {
    if (interrupt_flag) interrupt_flag->store(true);
}
}

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void set_interrupt_flag(std::atomic<bool>* flag) {
    interrupt_flag = flag;
    std::signal(SIGINT, flag ? on_sigint : SIG_DFL);
}

} // namespace platform
