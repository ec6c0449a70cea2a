#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <limits>
#include <array>
#include <utility>

namespace oosvalidator
{
  namespace rng_utils
  {

    // --- Detection: does Rng have .engine()? (e.g., randutils::mt19937_rng) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Return a reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();     // randutils::mt19937_rng, UniformRng<>
      else
	return rng;              // std::mt19937_64, Mwc256
    }

    // Pull a raw 64-bit value from the engine. 32-bit engines are called twice
    // so every caller gets a full-width value.
    template <typename Rng>
    inline std::uint64_t get_random_value(Rng& rng)
    {
      auto& eng = get_engine(rng);
      using Eng = std::remove_reference_t<decltype(eng)>;
      using result_type = typename Eng::result_type;

      if constexpr (std::numeric_limits<result_type>::digits >= 64)
	return static_cast<std::uint64_t>(eng());
      else
	{
	  const std::uint64_t hi = static_cast<std::uint64_t>(eng()) & 0xFFFFFFFFull;
	  const std::uint64_t lo = static_cast<std::uint64_t>(eng()) & 0xFFFFFFFFull;
	  return (hi << 32) | lo;
	}
    }

    /**
     * @brief Uniform double in [0, 1) computed directly from engine bits.
     *
     * std::uniform_real_distribution is implementation defined, so a seeded
     * bootstrap would give different bounds under libstdc++ and libc++. Here
     * the conversion is fixed: 53 high bits for 64-bit engines, the full word
     * divided by 2^32 for 32-bit engines.
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      auto& eng = get_engine(rng);
      using Eng = std::remove_reference_t<decltype(eng)>;
      using result_type = typename Eng::result_type;

      static_assert(Eng::min() == 0, "get_random_uniform_01 expects an engine with min() == 0");

      if constexpr (std::numeric_limits<result_type>::digits >= 64)
	{
	  const std::uint64_t bits = static_cast<std::uint64_t>(eng()) >> 11;
	  return static_cast<double>(bits) * (1.0 / 9007199254740992.0); // 2^-53
	}
      else
	{
	  const std::uint64_t bits = static_cast<std::uint64_t>(eng()) & 0xFFFFFFFFull;
	  return static_cast<double>(bits) * (1.0 / 4294967296.0);       // 2^-32
	}
    }

    /**
     * @brief Random index in [0, hiExclusive) as floor(u * n), clamped to n-1.
     *
     * This is the draw used by every bootstrap resample in the project.
     *
     * @pre hiExclusive > 0 (returns 0 otherwise)
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      const std::size_t k =
	static_cast<std::size_t>(get_random_uniform_01(rng) * static_cast<double>(hiExclusive));
      return k < hiExclusive ? k : hiExclusive - 1;
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Expand a 64-bit seed into eight 32-bit words so mt19937 style engines
    // get a well mixed initial state even from small seeds like 1, 2, 3.
    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s0 + 0xd1342543de82ef95ull);
      const uint64_t s4 = splitmix64(s1 ^ 0x94d049bb133111ebull);
      const uint64_t s5 = splitmix64(s2 + 0xbf58476d1ce4e5b9ull);
      const uint64_t s6 = splitmix64(s3 ^ 0x6a09e667f3bcc909ull);
      const uint64_t s7 = splitmix64(s4 + 0x243f6a8885a308d3ull);

      const uint64_t mix = (s3 ^ s5 ^ s6 ^ s7);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(mix), static_cast<uint32_t>(mix >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    // Helper: construct a seeded engine regardless of API style
    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(sseq);     // std::mt19937_64(ss), randutils::mt19937_rng(ss)
	}
      else
	{
	  Eng e;
	  e.seed(sseq);
	  return e;
	}
    }

    template<class Eng>
    inline Eng make_seeded_engine(uint64_t seed64)
    {
      auto sseq = make_seed_seq(seed64);
      return construct_seeded_engine<Eng>(sseq);
    }

    /**
     * @brief The single uniform random source every resampler draws through.
     *
     * Owns its engine; callers create one per computation (or per search) and
     * pass it by reference. There is no hidden global generator anywhere in the
     * project, so a fixed seed reproduces every bootstrap and CSCV result.
     *
     * An integer seed is expanded through make_seed_seq for every engine
     * type. To replay the legacy multiply-with-carry stream of a given seed,
     * construct from the engine instead: UniformRng<Mwc256>(Mwc256(seed)).
     *
     * @tparam Eng Engine type. std::mt19937_64 by default.
     */
    template<class Eng = std::mt19937_64>
    class UniformRng
    {
    public:
      using Engine = Eng;
      using result_type = typename Eng::result_type;

      explicit UniformRng(uint64_t seed)
	: m_engine(make_seeded_engine<Eng>(seed)),
	  m_seed(seed)
      {}

      explicit UniformRng(Eng engine)
	: m_engine(std::move(engine)),
	  m_seed(0)
      {}

      void seed(uint64_t seed)
      {
	m_engine = make_seeded_engine<Eng>(seed);
	m_seed = seed;
      }

      uint64_t initialSeed() const noexcept
      {
	return m_seed;
      }

      // Uniform in [0, 1)
      double uniform01()
      {
	return get_random_uniform_01(m_engine);
      }

      // Uniform index in [0, n)
      std::size_t index(std::size_t n)
      {
	return get_random_index(m_engine, n);
      }

      // Fresh 64-bit value, used to seed per-replicate engines
      uint64_t nextSeed()
      {
	return get_random_value(m_engine);
      }

      Eng& engine() noexcept
      {
	return m_engine;
      }

      // UniformRandomBitGenerator so <random> distributions can use it too
      static constexpr result_type min() { return Eng::min(); }
      static constexpr result_type max() { return Eng::max(); }
      result_type operator()() { return m_engine(); }

    private:
      Eng      m_engine;
      uint64_t m_seed;
    };
  } // namespace rng_utils
} // namespace oosvalidator
