#pragma once
#include "input/KeyEvent.hpp"
#include <string>
#include <vector>

// Turns raw terminal bytes into KeyEvents: CSI and SS3 escape sequences,
// Alt-prefixed keys, control characters and UTF-8 text. Incomplete
// sequences at the end of a chunk are kept until the next feed().
class KeyDecoder {
public:
    std::vector<KeyEvent> feed(const std::string& bytes);

    // Emits whatever is still pending (a lone ESC becomes Escape)
    std::vector<KeyEvent> flush();

    bool hasPending() const { return !pending_.empty(); }

private:
    // Decodes one event at pos; returns bytes consumed, 0 if incomplete
    size_t decodeOne(const std::string& buf, size_t pos, KeyEvent& out,
                     bool final) const;
    size_t decodeCsi(const std::string& buf, size_t pos, KeyEvent& out) const;
    size_t decodeSs3(const std::string& buf, size_t pos, KeyEvent& out) const;

    std::string pending_;
};
