#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace test
{
	[[nodiscard]] inline std::vector<std::byte> bytes(std::string_view a_string)
	{
		const auto view = std::as_bytes(std::span{ a_string });
		return { view.begin(), view.end() };
	}

	// hands out at most `chunk` bytes per call and counts how often it was asked
	class trickle_source
	{
	public:
		trickle_source(std::vector<std::byte> a_data, std::size_t a_chunk = 1) :
			_data(std::move(a_data)),
			_chunk(a_chunk)
		{}

		std::size_t read_some(std::span<std::byte> a_dst)
		{
			++this->calls;
			const auto count = std::min({ a_dst.size(), this->_chunk, this->_data.size() - this->_pos });
			if (count > 0) {
				std::memcpy(a_dst.data(), this->_data.data() + this->_pos, count);
			}
			this->_pos += count;
			return count;
		}

		[[nodiscard]] std::size_t consumed() const noexcept { return this->_pos; }

		std::size_t calls{ 0 };

	private:
		std::vector<std::byte> _data;
		std::size_t _chunk;
		std::size_t _pos{ 0 };
	};

	// yields `limit` zero bytes, then reports an I/O error
	class failing_source
	{
	public:
		explicit failing_source(std::size_t a_limit) noexcept :
			_limit(a_limit)
		{}

		std::size_t read_some(std::span<std::byte> a_dst)
		{
			if (this->_pos == this->_limit) {
				throw std::runtime_error("device error");
			}

			const auto count = std::min(a_dst.size(), this->_limit - this->_pos);
			std::fill_n(a_dst.begin(), count, std::byte{ 0 });
			this->_pos += count;
			return count;
		}

	private:
		std::size_t _limit;
		std::size_t _pos{ 0 };
	};

	// an endless run of zero bytes
	class zero_source
	{
	public:
		std::size_t read_some(std::span<std::byte> a_dst) noexcept
		{
			std::fill(a_dst.begin(), a_dst.end(), std::byte{ 0 });
			this->produced += a_dst.size();
			return a_dst.size();
		}

		std::size_t produced{ 0 };
	};

	// accepts at most `chunk` bytes per call
	class trickle_sink
	{
	public:
		explicit trickle_sink(std::size_t a_chunk = 1) noexcept :
			_chunk(a_chunk)
		{}

		std::size_t write_some(std::span<const std::byte> a_src)
		{
			++this->calls;
			const auto count = std::min(a_src.size(), this->_chunk);
			this->data.insert(this->data.end(), a_src.begin(), a_src.begin() + count);
			return count;
		}

		std::vector<std::byte> data;
		std::size_t calls{ 0 };

	private:
		std::size_t _chunk;
	};

	// counts the bytes it receives and how many of them were not zero
	class counting_sink
	{
	public:
		std::size_t write_some(std::span<const std::byte> a_src) noexcept
		{
			this->largest_write = std::max(this->largest_write, a_src.size());
			for (const auto b : a_src) {
				if (b != std::byte{ 0 }) {
					++this->nonzero;
				}
			}
			this->received += a_src.size();
			return a_src.size();
		}

		std::size_t received{ 0 };
		std::size_t nonzero{ 0 };
		std::size_t largest_write{ 0 };
	};

	// accepts `limit` bytes, then reports an I/O error
	class failing_sink
	{
	public:
		explicit failing_sink(std::size_t a_limit) noexcept :
			_limit(a_limit)
		{}

		std::size_t write_some(std::span<const std::byte> a_src)
		{
			if (this->_pos == this->_limit) {
				throw std::runtime_error("device error");
			}

			const auto count = std::min(a_src.size(), this->_limit - this->_pos);
			this->_pos += count;
			return count;
		}

	private:
		std::size_t _limit;
		std::size_t _pos{ 0 };
	};
}
