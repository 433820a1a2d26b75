#include "reporter.hpp"
#include <iostream>

void ConsoleReporter::debug(const std::string& message) {
    if (!debug_enabled) return;
    std::cout << "DEBUG\t" << message << std::endl;
}

void ConsoleReporter::info(const std::string& message) {
    std::cout << message << std::endl;
}

void ConsoleReporter::warning(const std::string& message) {
    std::cerr << "WARNING\t" << message << std::endl;
}
