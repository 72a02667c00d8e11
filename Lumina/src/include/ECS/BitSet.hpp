#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Lumina::ECS {

// ---------------------------------------------------------------------------
// BitSet: growable set of bits stored in 64-bit words.
//
// Set() / Toggle() grow the set to cover the index; Clear() and Get() past
// the end are no-ops / false. ClearAll() zeroes the bits but keeps the size.
//
// Not synchronised; the owner provides locking.
// ---------------------------------------------------------------------------
class BitSet {
public:
    BitSet() = default;
    explicit BitSet(size_t capacity);

    void Set(size_t index);
    void Clear(size_t index);
    void Toggle(size_t index);
    [[nodiscard]] bool Get(size_t index) const noexcept;

    void Resize(size_t newLen);
    void ClearAll() noexcept;

    [[nodiscard]] size_t Size()  const noexcept { return m_len; }
    [[nodiscard]] bool   Empty() const noexcept { return m_len == 0; }

    // Number of set bits.
    [[nodiscard]] size_t Count() const noexcept;

    // Indices of every set bit, ascending.
    [[nodiscard]] std::vector<size_t> SetBits() const;

    // fn(size_t index) for every set bit, ascending.
    template<typename Fn>
    void ForEachSetBit(Fn&& fn) const {
        for (size_t w = 0; w < m_words.size(); ++w) {
            uint64_t word = m_words[w];
            while (word != 0) {
                const size_t bit = LowestBit(word);
                const size_t idx = w * WORD_BITS + bit;
                if (idx >= m_len) return;
                fn(idx);
                word &= word - 1; // drop the lowest set bit
            }
        }
    }

private:
    static constexpr size_t WORD_BITS = 64;

    [[nodiscard]] static size_t LowestBit(uint64_t word) noexcept;

    std::vector<uint64_t> m_words;
    size_t                m_len = 0;
};

} // namespace Lumina::ECS
