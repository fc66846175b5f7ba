#ifndef COBRA_RUNTIME_HPP
#define COBRA_RUNTIME_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cobra {

enum class Stream {
    Stdout,
    Stderr,
};

// Process boundary used by a command tree: where text goes, how the process ends, and where arguments come
// from when none are passed explicitly.
class Runtime {
public:
    virtual ~Runtime() = default;

    virtual void write(Stream stream, std::string_view text) = 0;
    virtual void exit(int code) = 0;
    // Arguments without the program name.
    [[nodiscard]] virtual std::vector<std::string> args() const = 0;
};

// std::cout / std::cerr / std::exit.
class ProcessRuntime : public Runtime {
public:
    ProcessRuntime() = default;
    ProcessRuntime(int argc, char** argv);

    void write(Stream stream, std::string_view text) override;
    [[noreturn]] void exit(int code) override;
    [[nodiscard]] std::vector<std::string> args() const override { return args_; }

private:
    std::vector<std::string> args_;
};

// Writes to caller-owned streams and records the exit code instead of ending the process.
class StreamRuntime : public Runtime {
public:
    StreamRuntime(std::ostream& out, std::ostream& err, std::vector<std::string> args = {})
        : out_(&out),
          err_(&err),
          args_(std::move(args)) {}

    void write(Stream stream, std::string_view text) override;
    void exit(int code) override { exitCode_ = code; }
    [[nodiscard]] std::vector<std::string> args() const override { return args_; }

    [[nodiscard]] const std::optional<int>& exitCode() const { return exitCode_; }

private:
    std::ostream* out_;
    std::ostream* err_;
    std::vector<std::string> args_;
    std::optional<int> exitCode_;
};

// Runtime used by trees that were not given one: a ProcessRuntime without arguments.
Runtime& defaultRuntime();

} // namespace cobra

#endif // COBRA_RUNTIME_HPP
