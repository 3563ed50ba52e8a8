#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <span>
#include <utility>

#include <catch2/catch_all.hpp>

#include "seqio/common.hpp"

TEST_CASE("endian store/load")
{
	const auto test = []<class T>(std::in_place_type_t<T>, std::uint64_t a_little, std::uint64_t a_big) {
		// test against unaligned memory
		const char payload[] = "\x00\x01\x02\x03\x04\x05\x06\x07\x08";
		std::array<char, sizeof(payload) - 1> buffer{};

		const auto readable = std::as_bytes(std::span{ payload }).subspan<1, sizeof(T)>();
		const auto writable = std::as_writable_bytes(std::span{ buffer }).subspan<1, sizeof(T)>();

		SECTION("reverse")
		{
			REQUIRE(a_little == seqio::endian::reverse(static_cast<T>(a_big)));
		}

		SECTION("load little-endian")
		{
			const auto i = seqio::endian::load<std::endian::little, T>(readable);
			REQUIRE(i == a_little);
		}

		SECTION("load big-endian")
		{
			const auto i = seqio::endian::load<std::endian::big, T>(readable);
			REQUIRE(i == a_big);
		}

		SECTION("store little-endian")
		{
			seqio::endian::store<std::endian::little>(writable, static_cast<T>(a_little));
			REQUIRE(std::ranges::equal(readable, writable));
		}

		SECTION("store big-endian")
		{
			seqio::endian::store<std::endian::big>(writable, static_cast<T>(a_big));
			REQUIRE(std::ranges::equal(readable, writable));
		}
	};

	SECTION("1 byte")
	{
		test(std::in_place_type<std::uint8_t>, 0x01, 0x01);
	}

	SECTION("2 bytes")
	{
		test(std::in_place_type<std::uint16_t>, 0x0201, 0x0102);
	}

	SECTION("4 bytes")
	{
		test(std::in_place_type<std::uint32_t>, 0x04030201, 0x01020304);
	}

	SECTION("8 bytes")
	{
		test(std::in_place_type<std::uint64_t>, 0x0807060504030201, 0x0102030405060708);
	}
}

TEST_CASE("floating point values are stored as their IEEE-754 bit pattern")
{
	SECTION("float")
	{
		std::array<std::byte, 4> buffer{};
		const auto bytes = std::span{ buffer };

		seqio::write(bytes, 1234.5678f, std::endian::little);
		REQUIRE(buffer == std::array{ std::byte{ 0x2B }, std::byte{ 0x52 }, std::byte{ 0x9A }, std::byte{ 0x44 } });
		REQUIRE(seqio::read<float>(bytes, std::endian::little) == 1234.5678f);

		seqio::write(bytes, 1234.5678f, std::endian::big);
		REQUIRE(buffer == std::array{ std::byte{ 0x44 }, std::byte{ 0x9A }, std::byte{ 0x52 }, std::byte{ 0x2B } });
		REQUIRE(seqio::read<float>(bytes, std::endian::big) == 1234.5678f);
	}

	SECTION("double")
	{
		std::array<std::byte, 8> buffer{};
		const auto bytes = std::span{ buffer };

		seqio::write(bytes, 1234.5678, std::endian::big);
		REQUIRE(buffer == std::array{
							  std::byte{ 0x40 },
							  std::byte{ 0x93 },
							  std::byte{ 0x4A },
							  std::byte{ 0x45 },
							  std::byte{ 0x6D },
							  std::byte{ 0x5C },
							  std::byte{ 0xFA },
							  std::byte{ 0xAD },
						  });
		REQUIRE(seqio::read<double>(bytes, std::endian::big) == 1234.5678);
	}

	SECTION("special values pass through untouched")
	{
		std::array<std::byte, 8> buffer{};
		const auto bytes = std::span{ buffer };

		const auto nan = std::bit_cast<double>(std::uint64_t{ 0x7FF8'0000'DEAD'BEEF });
		seqio::write(bytes, nan, std::endian::little);
		const auto loaded = seqio::read<double>(bytes, std::endian::little);
		REQUIRE(std::isnan(loaded));
		REQUIRE(std::bit_cast<std::uint64_t>(loaded) == 0x7FF8'0000'DEAD'BEEF);

		seqio::write(bytes, -std::numeric_limits<double>::infinity(), std::endian::big);
		REQUIRE(seqio::read<double>(bytes, std::endian::big) == -std::numeric_limits<double>::infinity());
	}
}

TEST_CASE("every error derives from seqio::exception")
{
	STATIC_REQUIRE(std::derived_from<seqio::buffer_exhausted, seqio::exception>);
	STATIC_REQUIRE(std::derived_from<seqio::unbound_stream, seqio::exception>);
	STATIC_REQUIRE(std::derived_from<seqio::endian_unset, seqio::exception>);
	STATIC_REQUIRE(std::derived_from<seqio::invalid_argument, seqio::exception>);
	STATIC_REQUIRE(std::derived_from<seqio::exception, std::exception>);

	REQUIRE_THAT(
		seqio::buffer_exhausted().what(),
		Catch::Matchers::ContainsSubstring("end of input", Catch::CaseSensitive::No));
}

TEST_CASE("stream_state tracks position and endian format")
{
	seqio::components::stream_state state{ std::endian::big };
	REQUIRE(state.tell() == 0);
	REQUIRE(state.endian() == std::endian::big);

	state.advance(3);
	state.advance(4);
	REQUIRE(state.tell() == 7);

	state.endian(std::nullopt);
	REQUIRE_THROWS_AS(state.require_endian("no endian"), seqio::endian_unset);

	state.reset(std::endian::little);
	REQUIRE(state.tell() == 0);
	REQUIRE(state.require_endian("no endian") == std::endian::little);
}
