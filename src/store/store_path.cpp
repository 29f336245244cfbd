#include <nixup/store/store_path.hpp>

#include <algorithm>
#include <vector>

namespace nixup {

namespace {

constexpr char FRAGMENT_DELIMITER = '-';
constexpr char SUFFIX_SEPARATOR = '|';

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
bool is_alpha(char c) { return is_lower(c) || (c >= 'A' && c <= 'Z'); }

bool has_digit(std::string_view s) {
    return std::any_of(s.begin(), s.end(), is_digit);
}

bool is_alphabetic(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_alpha);
}

std::vector<std::string_view> split_fragments(std::string_view s) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(FRAGMENT_DELIMITER, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string join_fragments(const std::vector<std::string_view>& frags,
                           size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) out += FRAGMENT_DELIMITER;
        out.append(frags[i].data(), frags[i].size());
    }
    return out;
}

} // anonymous namespace

std::optional<std::string_view> StorePath::strip_prefix(std::string_view raw) {
    // Neither the store directory nor the base32 hash contain a dash, so the
    // first one ends the prefix
    size_t pos = raw.find(FRAGMENT_DELIMITER);
    if (pos == std::string_view::npos || pos + 1 >= raw.size()) {
        return std::nullopt;
    }
    return raw.substr(pos + 1);
}

bool StorePath::is_version_fragment(std::string_view fragment) {
    if (fragment.empty()) return false;

    if (fragment[0] == 'v') {
        if (fragment.size() < 2 || !is_digit(fragment[1])) return false;
        fragment.remove_prefix(1);
    } else if (!is_digit(fragment[0])) {
        return false;
    }

    return std::all_of(fragment.begin(), fragment.end(), [](char c) {
        return is_digit(c) || is_lower(c) || c == '.' || c == '_';
    });
}

std::optional<StorePath> StorePath::parse(std::string_view raw) {
    auto stripped = strip_prefix(raw);
    if (!stripped) return std::nullopt;

    auto frags = split_fragments(*stripped);
    if (frags.size() < 2) return std::nullopt;

    StorePath sp;
    sp.path = std::string(raw);

    // "<name>-<version>" fast path
    if (frags.size() == 2) {
        if (frags[0].empty() || !has_digit(frags[1])) return std::nullopt;
        sp.name = std::string(frags[0]);
        sp.version = std::string(frags[1]);
        return sp;
    }

    // A trailing dash never yields a usable path
    if (frags.back().empty()) return std::nullopt;

    size_t version_end = frags.size();
    if (is_alphabetic(frags.back())) {
        sp.suffix = std::string(frags.back());
        --version_end;
    }

    // Fragment 0 always belongs to the name
    size_t version_start = 0;
    for (size_t i = 1; i < version_end; ++i) {
        if (is_version_fragment(frags[i])) {
            version_start = i;
            break;
        }
    }
    if (version_start == 0) return std::nullopt;

    sp.name = join_fragments(frags, 0, version_start);
    sp.version = join_fragments(frags, version_start, version_end);
    return sp;
}

std::string StorePath::key() const {
    if (!suffix) return name;
    std::string k = name;
    k.reserve(name.size() + 1 + suffix->size());
    k += SUFFIX_SEPARATOR;
    k += *suffix;
    return k;
}

std::string StorePath::display_name() const {
    if (!suffix) return name;
    return name + " (" + *suffix + ")";
}

} // namespace nixup
