#include "seqio/seqio.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <span>
#include <utility>

namespace seqio
{
	std::size_t span_source::read_some(std::span<std::byte> a_dst) noexcept
	{
		const auto count = std::min(a_dst.size_bytes(), this->remaining());
		if (count == 0) {
			return 0;
		}

		const auto where = this->tell();
		std::memcpy(a_dst.data(), this->rdbuf().data() + where, count);
		this->seek_relative(static_cast<seqio::streamoff>(count));
		return count;
	}

	std::size_t span_sink::write_some(std::span<const std::byte> a_src) noexcept
	{
		const auto count = std::min(a_src.size_bytes(), this->remaining());
		if (count == 0) {
			return 0;
		}

		const auto where = this->tell();
		std::memcpy(this->rdbuf().data() + where, a_src.data(), count);
		this->seek_relative(static_cast<seqio::streamoff>(count));
		return count;
	}

	reader::reader(
		seqio::any_source a_source,
		std::optional<std::endian> a_endian) noexcept :
		_source(std::move(a_source)),
		_state(a_endian)
	{}

	void reader::read_bytes(std::span<std::byte> a_dst)
	{
		if (a_dst.empty()) {
			return;
		}

		this->require_source("reader::read_bytes: no source is bound");

		if (const auto pending = this->pending_peek(); !pending.empty()) {
			const auto count = std::min(pending.size(), a_dst.size());
			std::memcpy(a_dst.data(), pending.data(), count);
			this->consume_peek(count);
			this->_state.advance(count);
			a_dst = a_dst.subspan(count);
		}

		while (!a_dst.empty()) {
			const auto read = this->_source.read_some(a_dst);
			if (read == 0) {
				throw seqio::buffer_exhausted();
			}

			assert(read <= a_dst.size());
			this->_state.advance(read);
			a_dst = a_dst.subspan(read);
		}
	}

	std::vector<std::byte> reader::read_bytes(std::size_t a_count)
	{
		std::vector<std::byte> result(a_count);
		this->read_bytes(std::span{ result });
		return result;
	}

	std::byte reader::read_byte()
	{
		std::byte result{};
		this->read_bytes({ &result, 1 });
		return result;
	}

	std::size_t reader::read_some(std::span<std::byte> a_dst)
	{
		if (a_dst.empty()) {
			return 0;
		}

		this->require_source("reader::read_some: no source is bound");

		std::size_t count = 0;
		if (const auto pending = this->pending_peek(); !pending.empty()) {
			count = std::min(pending.size(), a_dst.size());
			std::memcpy(a_dst.data(), pending.data(), count);
			this->consume_peek(count);
		} else {
			count = this->_source.read_some(a_dst);
		}

		this->_state.advance(count);
		return count;
	}

	void reader::discard(std::size_t a_count)
	{
		if (a_count == 0) {
			return;
		}

		this->require_source("reader::discard: no source is bound");

		const auto scratch = std::span{ this->_scratch };
		while (a_count > 0) {
			const auto chunk = std::min(a_count, scratch.size());
			this->read_bytes(scratch.first(chunk));
			a_count -= chunk;
		}
	}

	void reader::peek(std::span<std::byte> a_dst)
	{
		if (a_dst.empty()) {
			return;
		}

		this->require_source("reader::peek: no source is bound");

		if (const auto available = this->peek_available();
			available < a_dst.size()) {
			const auto need = a_dst.size() - available;
			this->reserve_peek(a_dst.size());

			// _peek_end only moves once every byte has arrived, so a failed fetch leaves
			// the pending run as it was
			auto window = std::span{ this->_peek }.subspan(this->_peek_end, need);
			while (!window.empty()) {
				const auto read = this->_source.read_some(window);
				if (read == 0) {
					throw seqio::buffer_exhausted();
				}

				assert(read <= window.size());
				window = window.subspan(read);
			}

			this->_peek_end += need;
		}

		std::memcpy(a_dst.data(), this->_peek.data() + this->_peek_pos, a_dst.size());
	}

	void reader::reserve_peek(std::size_t a_count)
	{
		if (this->_peek_pos + a_count <= this->_peek.size()) {
			return;
		}

		if (this->_peek_pos > 0) {
			const auto available = this->peek_available();
			std::memmove(
				this->_peek.data(),
				this->_peek.data() + this->_peek_pos,
				available);
			this->_peek_pos = 0;
			this->_peek_end = available;
		}

		if (a_count > this->_peek.size()) {
			this->_peek.resize(std::max(a_count, this->_peek.size() + peek_increment));
		}
	}

	void reader::reset(
		seqio::any_source a_source,
		std::optional<std::endian> a_endian) noexcept
	{
		this->_source = std::move(a_source);
		this->_state.reset(a_endian);
		this->_peek_pos = 0;
		this->_peek_end = 0;
	}

	void reader::require_source(const char* a_what) const
	{
		if (!this->_source.has_value()) {
			throw seqio::unbound_stream(a_what);
		}
	}

	void reader::consume_peek(std::size_t a_count) noexcept
	{
		assert(a_count <= this->peek_available());
		this->_peek_pos += a_count;
		if (this->_peek_pos == this->_peek_end) {
			this->_peek_pos = 0;
			this->_peek_end = 0;
		}
	}

	writer::writer(
		seqio::any_sink a_sink,
		std::optional<std::endian> a_endian) noexcept :
		_sink(std::move(a_sink)),
		_state(a_endian)
	{}

	void writer::write_bytes(std::span<const std::byte> a_src)
	{
		if (a_src.empty()) {
			return;
		}

		this->require_sink("writer::write_bytes: no sink is bound");

		while (!a_src.empty()) {
			const auto written = this->_sink.write_some(a_src);
			if (written == 0) {
				throw seqio::buffer_exhausted("sink stopped accepting bytes");
			}

			assert(written <= a_src.size());
			this->_state.advance(written);
			a_src = a_src.subspan(written);
		}
	}

	void writer::write_byte(std::byte a_value)
	{
		this->write_bytes({ &a_value, 1 });
	}

	std::size_t writer::write_some(std::span<const std::byte> a_src)
	{
		if (a_src.empty()) {
			return 0;
		}

		this->require_sink("writer::write_some: no sink is bound");

		const auto written = this->_sink.write_some(a_src);
		this->_state.advance(written);
		return written;
	}

	void writer::zero_fill(seqio::streamoff a_count)
	{
		if (a_count < 0) {
			throw seqio::invalid_argument("writer::zero_fill: negative length");
		}

		if (a_count == 0) {
			return;
		}

		this->require_sink("writer::zero_fill: no sink is bound");

		const auto zeroes = std::span{ std::as_const(this->_zeroes) };
		auto remaining = static_cast<std::size_t>(a_count);
		while (remaining > 0) {
			const auto chunk = std::min(remaining, zeroes.size());
			this->write_bytes(zeroes.first(chunk));
			remaining -= chunk;
		}
	}

	void writer::reset(
		seqio::any_sink a_sink,
		std::optional<std::endian> a_endian) noexcept
	{
		this->_sink = std::move(a_sink);
		this->_state.reset(a_endian);
	}

	void writer::require_sink(const char* a_what) const
	{
		if (!this->_sink.has_value()) {
			throw seqio::unbound_stream(a_what);
		}
	}
}
