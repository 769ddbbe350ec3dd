#include "Console.hpp"

void Console::println(std::string_view line) {
    std::scoped_lock lock(_mutex);
    _out << line << '\n';
    _out.flush();
}

void Console::print(std::string_view text) {
    std::scoped_lock lock(_mutex);
    _out << text;
    _out.flush();
}
