#include "domain/LineDiff.hpp"
#include <algorithm>
#include <cstdint>
#include <unordered_map>

namespace versionlens::domain {

namespace {

using LineIds = std::vector<uint32_t>;

// LCS lengths of a[a0, a1) against every prefix b[b0, b0 + k), k = 0..b1 - b0.
std::vector<uint32_t> ForwardLengths(const LineIds& a, size_t a0, size_t a1,
                                     const LineIds& b, size_t b0, size_t b1) {
    const size_t m = b1 - b0;
    std::vector<uint32_t> prev(m + 1, 0);
    std::vector<uint32_t> cur(m + 1, 0);
    for (size_t i = a0; i < a1; ++i) {
        cur[0] = 0;
        for (size_t j = 1; j <= m; ++j) {
            cur[j] = a[i] == b[b0 + j - 1] ? prev[j - 1] + 1 : std::max(prev[j], cur[j - 1]);
        }
        prev.swap(cur);
    }
    return prev;
}

// LCS lengths of a[a0, a1) against every suffix b[b0 + k, b1), k = 0..b1 - b0.
std::vector<uint32_t> BackwardLengths(const LineIds& a, size_t a0, size_t a1,
                                      const LineIds& b, size_t b0, size_t b1) {
    const size_t m = b1 - b0;
    std::vector<uint32_t> prev(m + 1, 0);
    std::vector<uint32_t> cur(m + 1, 0);
    for (size_t i = a1; i-- > a0;) {
        cur[m] = 0;
        for (size_t j = m; j-- > 0;) {
            cur[j] = a[i] == b[b0 + j] ? prev[j + 1] + 1 : std::max(prev[j], cur[j + 1]);
        }
        prev.swap(cur);
    }
    return prev;
}

/**
 * Hirschberg's divide and conquer: working rows are linear in the right side,
 * recursion depth logarithmic in the left side.
 */
class ScriptBuilder {
public:
    // a and b hold the ids of left and right starting at offset.
    ScriptBuilder(const std::vector<std::string>& left, const std::vector<std::string>& right, size_t offset,
                  const LineIds& a, const LineIds& b, std::vector<LineChange>& script)
        : m_left(left), m_right(right), m_offset(offset), m_a(a), m_b(b), m_script(script) {}

    void build(size_t a0, size_t a1, size_t b0, size_t b1) {
        if (a0 == a1) {
            added(b0, b1);
            return;
        }
        if (b0 == b1) {
            removed(a0, a1);
            return;
        }
        if (a1 - a0 == 1) {
            auto it = std::find(m_b.begin() + b0, m_b.begin() + b1, m_a[a0]);
            if (it == m_b.begin() + b1) {
                removed(a0, a1);
                added(b0, b1);
                return;
            }
            size_t k = static_cast<size_t>(it - m_b.begin());
            added(b0, k);
            m_script.push_back({LineChange::Kind::Unchanged, m_left[m_offset + a0]});
            added(k + 1, b1);
            return;
        }

        const size_t mid = a0 + (a1 - a0) / 2;
        std::vector<uint32_t> top = ForwardLengths(m_a, a0, mid, m_b, b0, b1);
        std::vector<uint32_t> bottom = BackwardLengths(m_a, mid, a1, m_b, b0, b1);

        // Smallest split on ties: the top half gives up its right-hand lines, so removals come first.
        size_t split = 0;
        uint32_t best = 0;
        for (size_t k = 0; k <= b1 - b0; ++k) {
            uint32_t total = top[k] + bottom[k];
            if (k == 0 || total > best) {
                best = total;
                split = k;
            }
        }
        top.clear();
        top.shrink_to_fit();
        bottom.clear();
        bottom.shrink_to_fit();

        build(a0, mid, b0, b0 + split);
        build(mid, a1, b0 + split, b1);
    }

private:
    void added(size_t from, size_t to) {
        for (size_t j = from; j < to; ++j) m_script.push_back({LineChange::Kind::Added, m_right[m_offset + j]});
    }

    void removed(size_t from, size_t to) {
        for (size_t i = from; i < to; ++i) m_script.push_back({LineChange::Kind::Removed, m_left[m_offset + i]});
    }

    const std::vector<std::string>& m_left;
    const std::vector<std::string>& m_right;
    size_t m_offset;
    const LineIds& m_a;
    const LineIds& m_b;
    std::vector<LineChange>& m_script;
};

} // namespace

std::vector<LineChange> LineDiff::Compute(const std::vector<std::string>& left,
                                          const std::vector<std::string>& right) {
    size_t prefix = 0;
    while (prefix < left.size() && prefix < right.size() && left[prefix] == right[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < left.size() - prefix && suffix < right.size() - prefix &&
           left[left.size() - 1 - suffix] == right[right.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<LineChange> script;
    script.reserve(left.size() + right.size() - prefix - suffix);

    for (size_t k = 0; k < prefix; ++k) {
        script.push_back({LineChange::Kind::Unchanged, left[k]});
    }

    // Lines are interned so the quadratic inner loops compare integers.
    std::unordered_map<std::string, uint32_t> ids;
    auto intern = [&ids](const std::string& line) {
        return ids.emplace(line, static_cast<uint32_t>(ids.size())).first->second;
    };
    LineIds a;
    LineIds b;
    a.reserve(left.size() - prefix - suffix);
    b.reserve(right.size() - prefix - suffix);
    for (size_t i = prefix; i < left.size() - suffix; ++i) a.push_back(intern(left[i]));
    const size_t leftDistinct = ids.size();
    bool shared = false;
    for (size_t j = prefix; j < right.size() - suffix; ++j) {
        uint32_t id = intern(right[j]);
        shared = shared || id < leftDistinct;
        b.push_back(id);
    }

    ScriptBuilder builder(left, right, prefix, a, b, script);
    if (shared) {
        builder.build(0, a.size(), 0, b.size());
    } else {
        // Nothing in common: every left line goes, then every right line comes.
        builder.build(0, a.size(), 0, 0);
        builder.build(a.size(), a.size(), 0, b.size());
    }

    for (size_t k = left.size() - suffix; k < left.size(); ++k) {
        script.push_back({LineChange::Kind::Unchanged, left[k]});
    }
    return script;
}

void LineDiff::Collapse(const std::vector<LineChange>& changes, SectionDiff& out) {
    size_t i = 0;
    while (i < changes.size()) {
        if (changes[i].kind == LineChange::Kind::Unchanged) {
            ++i;
            continue;
        }

        std::vector<const std::string*> removed;
        while (i < changes.size() && changes[i].kind == LineChange::Kind::Removed) {
            removed.push_back(&changes[i].content);
            ++i;
        }
        std::vector<const std::string*> added;
        while (i < changes.size() && changes[i].kind == LineChange::Kind::Added) {
            added.push_back(&changes[i].content);
            ++i;
        }

        size_t paired = std::min(removed.size(), added.size());
        for (size_t k = 0; k < paired; ++k) {
            out.modifiedPairs.push_back({*removed[k], *added[k]});
        }
        for (size_t k = paired; k < removed.size(); ++k) {
            out.removedLines.push_back(*removed[k]);
        }
        for (size_t k = paired; k < added.size(); ++k) {
            out.addedLines.push_back(*added[k]);
        }
    }
}

} // namespace versionlens::domain
