#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;
Logger::Sink Logger::s_sink = &Logger::stderrSink;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

void Logger::setSink(Sink sink) {
    s_sink = (sink != nullptr) ? sink : &Logger::stderrSink;
}

void Logger::stderrSink(LogLevel level, const char* tag, const char* message) {
    static const char kLetters[] = {'E', 'W', 'I', 'D'};
    std::fprintf(stderr, "%c (%s) %s\n", kLetters[static_cast<int>(level)], tag, message);
}

void Logger::logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        s_sink(level, tag, "formatting error");
        return;
    }
    // vsnprintf truncates long lines; keep the terminator in place
    buffer[sizeof(buffer) - 1] = '\0';
    s_sink(level, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
