// tests/test-codec/main.cpp
// Manual harness: encode the command given on argv and print the frame, then decode it back.
//   test-codec dac 3 4096
//   test-codec table 1 49 0x4000
#include <iostream>
#include <string>
#include <vector>
#include "command_dispatch.hpp"
#include "log.hpp"

int main(int argc, char** argv) {
    // 1) Collect the words
    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i) words.emplace_back(argv[i]);

    // 2) Build the commands
    std::vector<dacwire::Command> cmds;
    std::string err;
    if (!dacwire::build_from_tokens(words, cmds, err)) {
        std::cout << "error: " << err << "\n";
        return 2;
    }

    // 3) Print each frame and what it decodes to
    for (const auto& c : cmds) {
        dacwire::Frame f = dacwire::encode(c);
        dacwire::Command back;
        bool ok = dacwire::decode(f.data(), f.size(), back);

        std::cout << "Command: " << dacwire::describe(c).c_str() << "\n";
        std::cout << "  kind:    " << dacwire::kind_name(c.kind) << "\n";
        std::cout << "  frame:   " << dacwire::to_hex(f.data(), f.size()) << "\n";
        std::cout << "  decoded: " << (ok ? dacwire::describe(back).c_str() : "(failed)")
                  << (ok && back == c ? "" : "  MISMATCH") << "\n";
    }
    return 0;
}
