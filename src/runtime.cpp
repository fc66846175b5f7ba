#include "cobra/runtime.hpp"

#include <cstdlib>
#include <iostream>

namespace cobra {

ProcessRuntime::ProcessRuntime(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) args_.emplace_back(argv[i]);
}

void ProcessRuntime::write(Stream stream, std::string_view text) {
    switch (stream) {
        case Stream::Stdout: std::cout << text; break;
        case Stream::Stderr: std::cerr << text; break;
    }
}

void ProcessRuntime::exit(int code) {
    std::cout.flush();
    std::cerr.flush();
    std::exit(code);
}

void StreamRuntime::write(Stream stream, std::string_view text) {
    switch (stream) {
        case Stream::Stdout: *out_ << text; break;
        case Stream::Stderr: *err_ << text; break;
    }
}

Runtime& defaultRuntime() {
    static ProcessRuntime runtime;
    return runtime;
}

} // namespace cobra
