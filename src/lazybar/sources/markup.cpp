#include <lazybar/sources/markup.h>
#include <ytrace/ytrace.hpp>
#include <optional>
#include <string>

namespace lazybar {

ContentItem parseMarkup(std::string_view text) {
    ContentItem item;
    std::optional<Color> fg;
    std::optional<Color> bg;
    std::string pending;

    auto flush = [&]() {
        if (pending.empty()) return;
        item.segments.push_back(Segment::makeText(std::move(pending), fg, bg));
        pending.clear();
    };

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 2, "%{") != 0) {
            pending += text[i++];
            continue;
        }

        size_t close = text.find('}', i + 2);
        if (close == std::string_view::npos) {
            pending.append(text.substr(i));
            break;
        }

        std::string_view directive = text.substr(i + 2, close - i - 2);
        i = close + 1;

        if (directive.size() < 2 || (directive[0] != 'F' && directive[0] != 'B')) {
            ydebug("parseMarkup: dropping directive '{}'", directive);
            continue;
        }

        std::optional<Color> color;
        std::string_view value = directive.substr(1);
        if (value != "-") {
            color = Color::parse(std::string(value));
            if (!color) {
                ydebug("parseMarkup: bad color '{}'", value);
                continue;
            }
        }

        flush();
        if (directive[0] == 'F') {
            fg = color;
        } else {
            bg = color;
        }
    }
    flush();
    return item;
}

} // namespace lazybar
