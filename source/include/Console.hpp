#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

// user-facing output, shared by the command shell and the event thread
class Console {
public:
    explicit Console(std::ostream& out): _out(out) {}

    void println(std::string_view line);
    void print(std::string_view text);

private:
    std::mutex _mutex;
    std::ostream& _out;
};
