#pragma once

#include <atomic>
#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to temp_dir().
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Set *flag to true when SIGINT arrives. Passing nullptr restores the
// default handler.
void set_interrupt_flag(std::atomic<bool>* flag);

} // namespace platform
