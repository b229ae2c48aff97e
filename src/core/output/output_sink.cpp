#include <tickloop/core/output/output_sink.hpp>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace TickLoop {

ConsoleOutputSink::ConsoleOutputSink() : out_(std::cout) {}

void ConsoleOutputSink::emit(const EventResult& result) {
    out_ << "Output for Event " << std::quoted(result.key) << ": " << result.result << "\n\n";
    out_.flush();
    if (!out_) {
        spdlog::critical("[ConsoleOutputSink] Output stream failed while writing {}", result.key);
        throw std::runtime_error("output stream failed while writing result for " + result.key);
    }
}

void LoggingOutputSink::emit(const EventResult& result) {
    spdlog::info("Output for Event \"{}\": {}", result.key, result.result);
}

} // namespace TickLoop
