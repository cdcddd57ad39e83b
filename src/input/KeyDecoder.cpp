#include "input/KeyDecoder.hpp"
#include <cstdlib>

namespace {

std::vector<int> parseParams(const std::string& s) {
    std::vector<int> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t semi = s.find(';', start);
        if (semi == std::string::npos) semi = s.size();
        std::string part = s.substr(start, semi - start);
        out.push_back(part.empty() ? 0 : std::atoi(part.c_str()));
        start = semi + 1;
    }
    return out;
}

// xterm modifier parameter: 1 + (shift | alt<<1 | ctrl<<2)
void applyModifiers(KeyEvent& ev, int mod) {
    if (mod <= 1) return;
    int bits = mod - 1;
    ev.shift = ev.shift || (bits & 1);
    ev.alt   = ev.alt   || (bits & 2);
    ev.ctrl  = ev.ctrl  || (bits & 4);
}

Key tildeKey(int code) {
    switch (code) {
        case 1: case 7:  return Key::Home;
        case 2:          return Key::Insert;
        case 3:          return Key::Delete;
        case 4: case 8:  return Key::End;
        case 5:          return Key::PageUp;
        case 6:          return Key::PageDown;
        case 11: return Key::F1;
        case 12: return Key::F2;
        case 13: return Key::F3;
        case 14: return Key::F4;
        case 15: return Key::F5;
        case 17: return Key::F6;
        case 18: return Key::F7;
        case 19: return Key::F8;
        case 20: return Key::F9;
        case 21: return Key::F10;
        case 23: return Key::F11;
        case 24: return Key::F12;
        default: return Key::Unknown;
    }
}

Key letterKey(char c) {
    switch (c) {
        case 'A': return Key::Up;
        case 'B': return Key::Down;
        case 'C': return Key::Right;
        case 'D': return Key::Left;
        case 'H': return Key::Home;
        case 'F': return Key::End;
        case 'P': return Key::F1;
        case 'Q': return Key::F2;
        case 'R': return Key::F3;
        case 'S': return Key::F4;
        default:  return Key::Unknown;
    }
}

size_t utf8Length(unsigned char lead) {
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    if (lead >= 0xE0) return lead < 0xF0 ? 3 : 0;
    if (lead >= 0xC2) return 2;
    return 0;
}

} // namespace

std::vector<KeyEvent> KeyDecoder::feed(const std::string& bytes) {
    std::string buf = pending_ + bytes;
    pending_.clear();

    std::vector<KeyEvent> out;
    size_t pos = 0;
    while (pos < buf.size()) {
        KeyEvent ev;
        size_t n = decodeOne(buf, pos, ev, false);
        if (n == 0) {
            pending_ = buf.substr(pos);
            break;
        }
        if (ev.key != Key::Unknown) out.push_back(ev);
        pos += n;
    }
    return out;
}

std::vector<KeyEvent> KeyDecoder::flush() {
    std::string buf;
    buf.swap(pending_);

    std::vector<KeyEvent> out;
    size_t pos = 0;
    while (pos < buf.size()) {
        KeyEvent ev;
        size_t n = decodeOne(buf, pos, ev, true);
        if (n == 0) n = 1;   // drop the undecodable byte
        if (ev.key != Key::Unknown) out.push_back(ev);
        pos += n;
    }
    return out;
}

size_t KeyDecoder::decodeOne(const std::string& buf, size_t pos,
                             KeyEvent& out, bool final) const {
    auto c = static_cast<unsigned char>(buf[pos]);
    size_t remaining = buf.size() - pos;

    if (c == 0x1b) {
        // A lone ESC at the end of a read is the Escape key
        if (remaining == 1) {
            out = KeyEvent::special(Key::Escape);
            return 1;
        }
        char next = buf[pos + 1];
        if (next == '[') {
            size_t n = decodeCsi(buf, pos, out);
            if (n == 0 && final) {
                out = KeyEvent::special(Key::Escape);
                return 1;
            }
            return n;
        }
        if (next == 'O') {
            size_t n = decodeSs3(buf, pos, out);
            if (n == 0 && final) {
                out = KeyEvent::special(Key::Escape);
                return 1;
            }
            return n;
        }
        if (next == 0x1b) {
            out = KeyEvent::special(Key::Escape);
            return 1;
        }
        // Alt + key
        size_t n = decodeOne(buf, pos + 1, out, final);
        if (n == 0) return 0;
        out.alt = true;
        return 1 + n;
    }

    if (c == '\r' || c == '\n') { out = KeyEvent::special(Key::Enter);     return 1; }
    if (c == '\t')              { out = KeyEvent::special(Key::Tab);       return 1; }
    if (c == 0x7f || c == 0x08) { out = KeyEvent::special(Key::Backspace); return 1; }

    if (c == 0x00) {
        out = KeyEvent::character(" ");
        out.ctrl = true;
        return 1;
    }
    if (c < 0x20) {
        out = KeyEvent::ctrlChar(static_cast<char>('a' + c - 1));
        return 1;
    }
    if (c < 0x80) {
        out = KeyEvent::character(std::string(1, static_cast<char>(c)));
        return 1;
    }

    size_t len = utf8Length(c);
    if (len == 0) {
        out = KeyEvent{};   // stray continuation or invalid lead byte
        return 1;
    }
    if (remaining < len) {
        if (!final) return 0;
        out = KeyEvent{};
        return 1;
    }
    for (size_t i = 1; i < len; i++) {
        auto cc = static_cast<unsigned char>(buf[pos + i]);
        if ((cc & 0xC0) != 0x80) {
            out = KeyEvent{};
            return 1;
        }
    }
    out = KeyEvent::character(buf.substr(pos, len));
    return len;
}

size_t KeyDecoder::decodeCsi(const std::string& buf, size_t pos, KeyEvent& out) const {
    size_t i = pos + 2;
    // Parameter and intermediate bytes
    while (i < buf.size()) {
        auto b = static_cast<unsigned char>(buf[i]);
        if (b < 0x20 || b > 0x3f) break;
        i++;
    }
    if (i >= buf.size()) return 0;

    char finalByte = buf[i];
    std::string raw = buf.substr(pos + 2, i - (pos + 2));
    auto params = parseParams(raw);
    size_t consumed = i - pos + 1;

    out = KeyEvent{};
    if (finalByte == '~') {
        out.key = tildeKey(params.empty() ? 0 : params[0]);
        if (params.size() > 1) applyModifiers(out, params[1]);
    } else if (finalByte == 'Z') {
        out.key = Key::BackTab;
        out.shift = true;
    } else {
        out.key = letterKey(finalByte);
        if (params.size() > 1) applyModifiers(out, params[1]);
    }
    return consumed;
}

size_t KeyDecoder::decodeSs3(const std::string& buf, size_t pos, KeyEvent& out) const {
    if (pos + 2 >= buf.size()) return 0;
    out = KeyEvent{};
    out.key = letterKey(buf[pos + 2]);
    return 3;
}
