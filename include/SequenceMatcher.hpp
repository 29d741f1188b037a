#ifndef PDFCMP_SEQUENCE_MATCHER_HPP
#define PDFCMP_SEQUENCE_MATCHER_HPP

#include <algorithm>
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pdfcmp {

/**
 * @brief Longest-matching-block sequence alignment (Ratcliff/Obershelp)
 *
 * Finds the longest contiguous matching block, then recurses on the pieces
 * to its left and right. The matching blocks drive both the similarity
 * ratio and the opcodes used to render diffs.
 *
 * With autoJunk enabled, elements of a second sequence of at least 200
 * items that occur more than 1% of the time ("popular" elements) are not
 * used to seed a match, but a match may still be extended over them. This
 * keeps matching on long texts close to linear in practice.
 *
 * @tparam T Element type; must be hashable and equality comparable
 */
template <typename T> class SequenceMatcher {
public:
  /// a[a .. a+size) == b[b .. b+size)
  struct Match {
    std::size_t a;
    std::size_t b;
    std::size_t size;
  };

  enum class OpTag { Equal, Replace, Delete, Insert };

  /// Turn a[i1..i2) into b[j1..j2)
  struct Opcode {
    OpTag tag;
    std::size_t i1;
    std::size_t i2;
    std::size_t j1;
    std::size_t j2;
  };

  SequenceMatcher(std::vector<T> a, std::vector<T> b, bool autoJunk = true)
      : m_a(std::move(a)), m_b(std::move(b)) {
    indexSecondSequence(autoJunk);
    computeMatchingBlocks();
  }

  /**
   * @brief Longest matching block in a[alo..ahi) and b[blo..bhi)
   *
   * Ties are broken by the earliest start in a, then in b. Returns a match
   * of size 0 (at alo, blo) when nothing matches.
   */
  Match findLongestMatch(std::size_t alo, std::size_t ahi, std::size_t blo,
                         std::size_t bhi) const {
    std::size_t besti = alo;
    std::size_t bestj = blo;
    std::size_t bestsize = 0;

    // lengths of the matches ending at a[i-1], b[j] keyed by j
    std::unordered_map<std::size_t, std::size_t> j2len;
    std::unordered_map<std::size_t, std::size_t> newj2len;

    for (std::size_t i = alo; i < ahi; ++i) {
      newj2len.clear();
      auto found = m_b2j.find(m_a[i]);
      if (found != m_b2j.end()) {
        for (std::size_t j : found->second) {
          if (j < blo) {
            continue;
          }
          if (j >= bhi) {
            break;
          }
          std::size_t k = 1;
          if (j > 0) {
            auto prev = j2len.find(j - 1);
            if (prev != j2len.end()) {
              k = prev->second + 1;
            }
          }
          newj2len[j] = k;
          if (k > bestsize) {
            besti = i + 1 - k;
            bestj = j + 1 - k;
            bestsize = k;
          }
        }
      }
      std::swap(j2len, newj2len);
    }

    // Popular elements never seed a match but may extend one
    while (besti > alo && bestj > blo && m_a[besti - 1] == m_b[bestj - 1]) {
      --besti;
      --bestj;
      ++bestsize;
    }
    while (besti + bestsize < ahi && bestj + bestsize < bhi &&
           m_a[besti + bestsize] == m_b[bestj + bestsize]) {
      ++bestsize;
    }

    return Match{besti, bestj, bestsize};
  }

  /**
   * @brief Non-overlapping matching blocks in increasing order
   *
   * Adjacent blocks are merged. The last entry is always the sentinel
   * {a.size(), b.size(), 0}.
   */
  const std::vector<Match> &matchingBlocks() const { return m_blocks; }

  /**
   * @brief Total number of matched elements
   */
  std::size_t matchedCount() const {
    std::size_t matched = 0;
    for (const auto &block : m_blocks) {
      matched += block.size;
    }
    return matched;
  }

  /**
   * @brief Similarity in [0, 1]: 2 * matched / (|a| + |b|)
   *
   * Two empty sequences are identical and score 1.0.
   */
  double ratio() const {
    std::size_t total = m_a.size() + m_b.size();
    if (total == 0) {
      return 1.0;
    }
    return 2.0 * static_cast<double>(matchedCount()) /
           static_cast<double>(total);
  }

  /**
   * @brief Edit operations turning a into b
   */
  std::vector<Opcode> opcodes() const {
    std::vector<Opcode> codes;
    std::size_t i = 0;
    std::size_t j = 0;

    for (const auto &block : m_blocks) {
      if (i < block.a && j < block.b) {
        codes.push_back({OpTag::Replace, i, block.a, j, block.b});
      } else if (i < block.a) {
        codes.push_back({OpTag::Delete, i, block.a, j, block.b});
      } else if (j < block.b) {
        codes.push_back({OpTag::Insert, i, block.a, j, block.b});
      }
      i = block.a + block.size;
      j = block.b + block.size;
      if (block.size > 0) {
        codes.push_back({OpTag::Equal, block.a, i, block.b, j});
      }
    }

    return codes;
  }

  /**
   * @brief Opcodes split into hunks with at most `context` equal elements
   * around each change
   *
   * Returns no groups when the sequences are equal.
   */
  std::vector<std::vector<Opcode>> groupedOpcodes(std::size_t context) const {
    std::vector<Opcode> codes = opcodes();
    if (codes.empty()) {
      codes.push_back({OpTag::Equal, 0, 1, 0, 1});
    }

    // Trim the leading and trailing equal runs to the context size
    Opcode &head = codes.front();
    if (head.tag == OpTag::Equal) {
      head.i1 = std::max(head.i1, head.i2 > context ? head.i2 - context : 0);
      head.j1 = std::max(head.j1, head.j2 > context ? head.j2 - context : 0);
    }
    Opcode &tail = codes.back();
    if (tail.tag == OpTag::Equal) {
      tail.i2 = std::min(tail.i2, tail.i1 + context);
      tail.j2 = std::min(tail.j2, tail.j1 + context);
    }

    std::vector<std::vector<Opcode>> groups;
    std::vector<Opcode> group;
    const std::size_t span = context + context;

    for (Opcode code : codes) {
      // Split at long equal runs, keeping context on both sides
      if (code.tag == OpTag::Equal && code.i2 - code.i1 > span) {
        group.push_back({OpTag::Equal, code.i1,
                         std::min(code.i2, code.i1 + context), code.j1,
                         std::min(code.j2, code.j1 + context)});
        groups.push_back(std::move(group));
        group.clear();
        code.i1 = std::max(code.i1, code.i2 - context);
        code.j1 = std::max(code.j1, code.j2 - context);
      }
      group.push_back(code);
    }

    if (!group.empty() &&
        !(group.size() == 1 && group.front().tag == OpTag::Equal)) {
      groups.push_back(std::move(group));
    }

    return groups;
  }

  const std::vector<T> &first() const { return m_a; }
  const std::vector<T> &second() const { return m_b; }

private:
  void indexSecondSequence(bool autoJunk) {
    for (std::size_t j = 0; j < m_b.size(); ++j) {
      m_b2j[m_b[j]].push_back(j);
    }

    const std::size_t n = m_b.size();
    if (autoJunk && n >= 200) {
      const std::size_t popularLimit = n / 100 + 1;
      for (auto it = m_b2j.begin(); it != m_b2j.end();) {
        if (it->second.size() > popularLimit) {
          it = m_b2j.erase(it);
        } else {
          ++it;
        }
      }
    }
  }

  void computeMatchingBlocks() {
    struct Range {
      std::size_t alo, ahi, blo, bhi;
    };

    std::vector<Range> pending{{0, m_a.size(), 0, m_b.size()}};
    std::vector<Match> blocks;

    while (!pending.empty()) {
      Range range = pending.back();
      pending.pop_back();

      Match match = findLongestMatch(range.alo, range.ahi, range.blo, range.bhi);
      if (match.size == 0) {
        continue;
      }
      blocks.push_back(match);
      if (range.alo < match.a && range.blo < match.b) {
        pending.push_back({range.alo, match.a, range.blo, match.b});
      }
      if (match.a + match.size < range.ahi &&
          match.b + match.size < range.bhi) {
        pending.push_back({match.a + match.size, range.ahi,
                           match.b + match.size, range.bhi});
      }
    }

    std::sort(blocks.begin(), blocks.end(),
              [](const Match &lhs, const Match &rhs) {
                return lhs.a != rhs.a ? lhs.a < rhs.a : lhs.b < rhs.b;
              });

    // Merge adjacent blocks
    std::vector<Match> merged;
    for (const auto &block : blocks) {
      if (!merged.empty() && merged.back().a + merged.back().size == block.a &&
          merged.back().b + merged.back().size == block.b) {
        merged.back().size += block.size;
      } else {
        merged.push_back(block);
      }
    }
    merged.push_back(Match{m_a.size(), m_b.size(), 0});

    m_blocks = std::move(merged);
  }

  std::vector<T> m_a; ///< First sequence
  std::vector<T> m_b; ///< Second sequence
  std::unordered_map<T, std::vector<std::size_t>>
      m_b2j; ///< Positions of each non-popular element of b
  std::vector<Match> m_blocks; ///< Matching blocks plus sentinel
};

} // namespace pdfcmp

#endif // PDFCMP_SEQUENCE_MATCHER_HPP
