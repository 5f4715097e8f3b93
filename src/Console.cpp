/**
 * Console.cpp - Colored terminal output shared by every flow
 */

#include "shlama/Console.hpp"

#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace shlama {

namespace {

const char* RESET = "\033[0m";
const char* BOLD = "\033[1m";
const char* DIM = "\033[2m";
const char* YELLOW = "\033[33m";
const char* GREEN = "\033[32m";
const char* RED = "\033[31m";
const char* CYAN = "\033[36m";

} // anonymous namespace

Console::Console(std::ostream& out, std::ostream& err, bool verbose, bool color, bool err_color)
    : out_(out), err_(err), verbose_(verbose), color_(color), err_color_(err_color) {}

Console Console::standard(bool verbose) {
    const char* no_color = std::getenv("NO_COLOR");
    bool allowed = !no_color || no_color[0] == '\0';
    return Console(std::cout, std::cerr, verbose,
                   allowed && isatty(STDOUT_FILENO), allowed && isatty(STDERR_FILENO));
}

std::string Console::paint(const char* code, const std::string& text) const {
    if (!color_) return text;
    return std::string(code) + text + RESET;
}

std::string Console::paintErr(const char* code, const std::string& text) const {
    if (!err_color_) return text;
    return std::string(code) + text + RESET;
}

std::string Console::bold(const std::string& text) const {
    return paint(BOLD, text);
}

void Console::suggestion(const std::string& command) {
    out_ << "\n" << paint(YELLOW, "💡") << " " << paint(BOLD, command) << "\n";
}

void Console::info(const std::string& message) {
    out_ << paint(CYAN, message) << "\n";
}

void Console::success(const std::string& message) {
    out_ << paint(GREEN, message) << "\n";
}

void Console::warn(const std::string& message) {
    err_ << paintErr(YELLOW, "⚠️  " + message) << "\n";
}

void Console::error(const std::string& message) {
    err_ << paintErr(RED, "Error: " + message) << "\n";
}

void Console::debug(const std::string& message) {
    if (!verbose_) return;
    err_ << paintErr(DIM, "[DEBUG] " + message) << "\n";
}

void Console::prompt(const std::string& question) {
    out_ << paint(GREEN, question);
    out_.flush();
}

} // namespace shlama
