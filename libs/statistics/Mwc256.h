#pragma once

#include <array>
#include <cstdint>
#include <random>

namespace oosvalidator
{
  /**
   * @brief Marsaglia's multiply-with-carry generator with a 256 word lag.
   *
   * Satisfies UniformRandomBitGenerator (32-bit output), so it can be used
   * as the engine of rng_utils::UniformRng. Seeding fills the lag table with
   * the linear congruential recurrence j = 69069 * j + 12345. Only the
   * uint32_t seed reproduces the legacy MWC256 stream; seeding from a
   * seed_seq first draws that word from the sequence.
   */
  class Mwc256
  {
  public:
    using result_type = std::uint32_t;

    static constexpr std::uint32_t DefaultSeed = 123456789u;

    Mwc256()
    {
      seed(DefaultSeed);
    }

    explicit Mwc256(std::uint32_t s)
    {
      seed(s);
    }

    void seed(std::uint32_t s)
    {
      std::uint32_t j = s;
      for (auto& word : m_q)
	{
	  j = 69069u * j + 12345u;
	  word = j;
	}

      m_carry = 362436u;
      m_index = 255;
    }

    // Used by rng_utils::construct_seeded_engine; one 32-bit word is drawn.
    void seed(std::seed_seq& sseq)
    {
      std::array<std::uint32_t, 1> word{};
      sseq.generate(word.begin(), word.end());
      seed(word[0]);
    }

    result_type operator()()
    {
      constexpr std::uint64_t A = 809430660ull;

      m_index = static_cast<std::uint8_t>(m_index + 1);
      const std::uint64_t t = A * static_cast<std::uint64_t>(m_q[m_index]) + m_carry;
      m_carry = static_cast<std::uint32_t>(t >> 32);
      m_q[m_index] = static_cast<std::uint32_t>(t & 0xFFFFFFFFull);
      return m_q[m_index];
    }

    static constexpr result_type min() { return 0u; }
    static constexpr result_type max() { return 0xFFFFFFFFu; }

    void discard(unsigned long long z)
    {
      for (; z != 0; --z)
	(*this)();
    }

  private:
    std::array<std::uint32_t, 256> m_q{};
    std::uint32_t                  m_carry = 362436u;
    std::uint8_t                   m_index = 255;
  };
}
