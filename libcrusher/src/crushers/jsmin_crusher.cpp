#include "../../include/jsmin_crusher.hpp"
#include "../../include/errors.hpp"
#include <string>

namespace {

constexpr int kEof = -1;

class Minifier {
public:
    explicit Minifier(const std::string_view input) : input_(input) {
        out_.reserve(input.size());
    }

    std::string run() {
        if (peek() == 0xEF) {
            get();
            get();
            get();
        }
        a_ = '\n';
        action(3);
        while (a_ != kEof) {
            switch (a_) {
                case ' ':
                    action(is_alphanum(b_) ? 1 : 2);
                    break;
                case '\n':
                    switch (b_) {
                        case '{': case '[': case '(':
                        case '+': case '-': case '!': case '~':
                            action(1);
                            break;
                        case ' ':
                            action(3);
                            break;
                        default:
                            action(is_alphanum(b_) ? 1 : 2);
                    }
                    break;
                default:
                    switch (b_) {
                        case ' ':
                            action(is_alphanum(a_) ? 1 : 3);
                            break;
                        case '\n':
                            switch (a_) {
                                case '}': case ']': case ')':
                                case '+': case '-':
                                case '"': case '\'': case '`':
                                    action(1);
                                    break;
                                default:
                                    action(is_alphanum(a_) ? 1 : 3);
                            }
                            break;
                        default:
                            action(1);
                    }
            }
        }
        // the algorithm always starts by emitting the synthetic leading newline
        if (!out_.empty() && out_.front() == '\n') out_.erase(0, 1);
        return std::move(out_);
    }

private:
    static bool is_alphanum(const int c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c == '\\' || c > 126;
    }

    [[noreturn]] static void fail(const char* message) {
        throw crusher::CrushError(crusher::ErrorKind::TransformFailed, std::string("JSMin error: ") + message);
    }

    // next input character; control characters other than newline become spaces
    int get() {
        int c = lookahead_;
        lookahead_ = kEof;
        if (c == kEof) {
            c = pos_ < input_.size() ? static_cast<unsigned char>(input_[pos_++]) : kEof;
        }
        if (c >= ' ' || c == '\n' || c == kEof) return c;
        if (c == '\r') return '\n';
        return ' ';
    }

    int peek() {
        lookahead_ = get();
        return lookahead_;
    }

    // get() with comments folded away
    int next() {
        int c = get();
        if (c == '/') {
            switch (peek()) {
                case '/':
                    for (;;) {
                        c = get();
                        if (c <= '\n') break;
                    }
                    break;
                case '*':
                    get();
                    while (c != ' ') {
                        switch (get()) {
                            case '*':
                                if (peek() == '/') {
                                    get();
                                    c = ' ';
                                }
                                break;
                            case kEof:
                                fail("Unterminated comment.");
                            default:
                                break;
                        }
                    }
                    break;
                default:
                    break;
            }
        }
        y_ = x_;
        x_ = c;
        return c;
    }

    void put(const int c) { out_.push_back(static_cast<char>(c)); }

    // 1: output A, copy B to A, get the next B
    // 2: copy B to A, get the next B
    // 3: get the next B
    void action(const int d) {
        if (d <= 1) {
            put(a_);
            if ((y_ == '\n' || y_ == ' ') &&
                (a_ == '+' || a_ == '-' || a_ == '*' || a_ == '/') &&
                b_ == a_) {
                put(y_);
            }
        }
        if (d <= 2) {
            a_ = b_;
            if (a_ == '\'' || a_ == '"' || a_ == '`') {
                for (;;) {
                    put(a_);
                    a_ = get();
                    if (a_ == b_) break;
                    if (a_ == '\\') {
                        put(a_);
                        a_ = get();
                    }
                    if (a_ == kEof) fail("Unterminated string literal.");
                }
            }
        }
        b_ = next();
        if (b_ == '/' && regex_may_follow(a_)) {
            put(a_);
            if (a_ == '/' || a_ == '*') put(' ');
            put(b_);
            for (;;) {
                a_ = get();
                if (a_ == '[') {
                    for (;;) {
                        put(a_);
                        a_ = get();
                        if (a_ == ']') break;
                        if (a_ == '\\') {
                            put(a_);
                            a_ = get();
                        }
                        if (a_ == kEof) fail("Unterminated set in Regular Expression literal.");
                    }
                } else if (a_ == '/') {
                    const int p = peek();
                    if (p == '/' || p == '*') fail("Unterminated set in Regular Expression literal.");
                    break;
                } else if (a_ == '\\') {
                    put(a_);
                    a_ = get();
                }
                if (a_ == kEof) fail("Unterminated Regular Expression literal.");
                put(a_);
            }
            b_ = next();
        }
    }

    static bool regex_may_follow(const int c) {
        switch (c) {
            case '(': case ',': case '=': case ':': case '[': case '!':
            case '&': case '|': case '?': case '+': case '-': case '~':
            case '*': case '/': case '{': case '}': case ';':
                return true;
            default:
                return false;
        }
    }

    std::string_view input_;
    std::size_t pos_ = 0;
    std::string out_;
    int a_ = kEof;
    int b_ = kEof;
    int lookahead_ = kEof;
    int x_ = kEof;
    int y_ = kEof;
};

} // namespace

namespace crusher {

    std::string JsminCrusher::run([[maybe_unused]] const ContentType type, const std::string_view content) const {
        return Minifier(content).run();
    }

} // namespace crusher
