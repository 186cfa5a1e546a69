#pragma once
#include <string>

// Terminal-independent key press, produced by the UI layer from ftxui
// events so the engines can be driven directly in tests.
struct KeyEvent {
    enum class Kind {
        Character,
        Enter,
        Escape,
        Backspace,
        Tab,
        ArrowLeft,
        ArrowRight,
        ArrowUp,
        ArrowDown,
        Interrupt,   // Ctrl-C
        Edit,        // Ctrl-E
        EndOfInput,  // Ctrl-D
        Other
    };

    Kind        kind = Kind::Other;
    std::string text;   // UTF-8 for Character

    static KeyEvent character(std::string c) { return {Kind::Character, std::move(c)}; }
    static KeyEvent of(Kind k) { return {k, {}}; }

    bool isChar(char c) const {
        return kind == Kind::Character && text.size() == 1 && text[0] == c;
    }
};
