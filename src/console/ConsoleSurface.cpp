#include "console/ConsoleSurface.hpp"
#include "console/arg_formatter.hpp"
#include <iostream>

namespace llm_reporter {

namespace {

void write_stdout(LogLevel, const ConsoleArgs& args) {
    std::cout << format_console_args(args).message << '\n';
}

void write_stderr(LogLevel, const ConsoleArgs& args) {
    std::cerr << format_console_args(args).message << '\n';
}

} // namespace

ConsoleSurface::ConsoleSurface() {
    slots_[static_cast<size_t>(LogLevel::Log)] = write_stdout;
    slots_[static_cast<size_t>(LogLevel::Info)] = write_stdout;
    slots_[static_cast<size_t>(LogLevel::Debug)] = write_stdout;
    slots_[static_cast<size_t>(LogLevel::Trace)] = write_stdout;
    slots_[static_cast<size_t>(LogLevel::Warn)] = write_stderr;
    slots_[static_cast<size_t>(LogLevel::Error)] = write_stderr;
}

ConsoleFn ConsoleSurface::get(LogLevel method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[static_cast<size_t>(method)];
}

void ConsoleSurface::set(LogLevel method, ConsoleFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[static_cast<size_t>(method)] = std::move(fn);
}

void ConsoleSurface::call(LogLevel method, const ConsoleArgs& args) const {
    ConsoleFn fn = get(method);
    if (fn) fn(method, args);
}

} // namespace llm_reporter
