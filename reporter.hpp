#ifndef REPORTER_HPP
#define REPORTER_HPP

#include <string>

// Diagnostics sink passed into the parsers and builders.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
};

// Writes info to stdout, warnings to stderr. Debug lines are dropped unless enabled.
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(bool debug_enabled = false) : debug_enabled(debug_enabled) {}

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;

private:
    bool debug_enabled;
};

// Discards everything.
class NullReporter : public Reporter {
public:
    void debug(const std::string&) override {}
    void info(const std::string&) override {}
    void warning(const std::string&) override {}
};

#endif // REPORTER_HPP
