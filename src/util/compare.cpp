#include <vercmp/compare.hpp>
#include <cctype>
#include <vector>

namespace vercmp {

template<typename T>
static Comparison three_way(const T& a, const T& b) {
    if (a < b) return Comparison::ALess;
    if (b < a) return Comparison::AGreater;
    return Comparison::Equal;
}

static std::vector<std::string> split_identifiers(const std::string& tag) {
    std::vector<std::string> ids;
    size_t start = 0;
    size_t dot;
    while ((dot = tag.find('.', start)) != std::string::npos) {
        ids.push_back(tag.substr(start, dot - start));
        start = dot + 1;
    }
    ids.push_back(tag.substr(start));
    return ids;
}

Comparison reverse(Comparison c) {
    switch (c) {
        case Comparison::ALess:    return Comparison::AGreater;
        case Comparison::AGreater: return Comparison::ALess;
        case Comparison::Equal:    return Comparison::Equal;
    }
    return Comparison::Equal;
}

const char* comparison_name(Comparison c) {
    switch (c) {
        case Comparison::ALess:    return "less";
        case Comparison::Equal:    return "equal";
        case Comparison::AGreater: return "greater";
    }
    return "unknown";
}

Comparison compare_core(const SemanticVersion& a, const SemanticVersion& b) {
    if (a.major() != b.major()) return three_way(a.major(), b.major());
    if (a.minor() != b.minor()) return three_way(a.minor(), b.minor());
    return three_way(a.effective_patch_level(), b.effective_patch_level());
}

Comparison compare(const SemanticVersion& a, const SemanticVersion& b) {
    Comparison core = compare_core(a, b);
    if (core != Comparison::Equal) return core;

    if (!a.is_pre_release() && !b.is_pre_release()) return Comparison::Equal;

    // 1.0.0-alpha < 1.0.0
    if (a.is_pre_release() && !b.is_pre_release()) return Comparison::ALess;
    if (!a.is_pre_release() && b.is_pre_release()) return Comparison::AGreater;

    return compare_pre_release(*a.pre_release(), *b.pre_release());
}

bool is_numeric_identifier(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Comparison compare_numeric_identifiers(const std::string& a, const std::string& b) {
    size_t a_start = a.find_first_not_of('0');
    size_t b_start = b.find_first_not_of('0');
    if (a_start == std::string::npos) a_start = a.size();
    if (b_start == std::string::npos) b_start = b.size();

    size_t a_len = a.size() - a_start;
    size_t b_len = b.size() - b_start;
    if (a_len != b_len) return three_way(a_len, b_len);

    // Same number of significant digits: ASCII order is numeric order
    int res = a.compare(a_start, a_len, b, b_start, b_len);
    if (res < 0) return Comparison::ALess;
    if (res > 0) return Comparison::AGreater;
    return Comparison::Equal;
}

Comparison compare_pre_release(const std::string& a, const std::string& b) {
    auto a_ids = split_identifiers(a);
    auto b_ids = split_identifiers(b);

    for (size_t i = 0; i < a_ids.size(); ++i) {
        // b ran out first
        if (i >= b_ids.size()) return Comparison::AGreater;

        const std::string& a_id = a_ids[i];
        const std::string& b_id = b_ids[i];
        bool a_numeric = is_numeric_identifier(a_id);
        bool b_numeric = is_numeric_identifier(b_id);

        Comparison res;
        if (a_numeric && b_numeric) {
            res = compare_numeric_identifiers(a_id, b_id);
        } else if (a_numeric) {
            return Comparison::ALess;
        } else if (b_numeric) {
            return Comparison::AGreater;
        } else {
            res = three_way(a_id, b_id);
        }
        if (res != Comparison::Equal) return res;
    }

    if (a_ids.size() < b_ids.size()) return Comparison::ALess;
    return Comparison::Equal;
}

} // namespace vercmp
