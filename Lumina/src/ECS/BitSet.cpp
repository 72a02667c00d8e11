#include <ECS/BitSet.hpp>

namespace Lumina::ECS {

BitSet::BitSet(size_t capacity)
{
    Resize(capacity);
}

void BitSet::Set(size_t index)
{
    if (index >= m_len) Resize(index + 1);
    m_words[index / WORD_BITS] |= (1ull << (index % WORD_BITS));
}

void BitSet::Clear(size_t index)
{
    if (index >= m_len) return;
    m_words[index / WORD_BITS] &= ~(1ull << (index % WORD_BITS));
}

void BitSet::Toggle(size_t index)
{
    if (index >= m_len) Resize(index + 1);
    m_words[index / WORD_BITS] ^= (1ull << (index % WORD_BITS));
}

bool BitSet::Get(size_t index) const noexcept
{
    if (index >= m_len) return false;
    return (m_words[index / WORD_BITS] & (1ull << (index % WORD_BITS))) != 0;
}

void BitSet::Resize(size_t newLen)
{
    const size_t words = (newLen + WORD_BITS - 1) / WORD_BITS;
    m_words.resize(words, 0ull);
    // Shrinking: drop bits that fall past the new end of the last word so a
    // later grow does not resurrect them.
    if (newLen < m_len && newLen % WORD_BITS != 0)
        m_words.back() &= (1ull << (newLen % WORD_BITS)) - 1ull;
    m_len = newLen;
}

void BitSet::ClearAll() noexcept
{
    for (auto& w : m_words) w = 0ull;
}

size_t BitSet::Count() const noexcept
{
    size_t n = 0;
    for (uint64_t w : m_words) {
        while (w != 0) { w &= w - 1; ++n; }
    }
    return n;
}

std::vector<size_t> BitSet::SetBits() const
{
    std::vector<size_t> out;
    out.reserve(Count());
    ForEachSetBit([&](size_t idx) { out.push_back(idx); });
    return out;
}

size_t BitSet::LowestBit(uint64_t word) noexcept
{
    size_t bit = 0;
    while ((word & 1ull) == 0) { word >>= 1; ++bit; }
    return bit;
}

} // namespace Lumina::ECS
