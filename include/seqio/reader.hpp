#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

#include "seqio/any_stream.hpp"
#include "seqio/common.hpp"

namespace seqio
{
	/// \brief Decodes bytes and typed values from a byte source, with support for lookahead.
	///
	/// \remark Bytes inspected with \ref peek are held in an internal buffer and handed out by
	///		subsequent reads before the source is touched again. \ref tell only ever counts bytes
	///		delivered to reads.
	/// \remark Running out of input is reported by throwing \ref buffer_exhausted.
	/// \remark A reader is not safe for concurrent use.
	class reader
	{
	public:
		/// \brief The minimum number of bytes the peek buffer grows by.
		static constexpr std::size_t peek_increment = 64;

		/// \brief The size of the chunks \ref discard drains the source in.
		static constexpr std::size_t scratch_size = 1024;

		/// \brief Constructs a reader without a source or endian format.
		reader() noexcept = default;

		/// \brief Constructs a reader bound to the given source and endian format.
		///
		/// \param a_source The source to read from.
		/// \param a_endian The default endian format, or `std::nullopt` for none.
		reader(
			seqio::any_source a_source,
			std::optional<std::endian> a_endian) noexcept;

		reader(const reader&) = delete;
		reader(reader&&) noexcept = default;
		~reader() noexcept = default;
		reader& operator=(const reader&) = delete;
		reader& operator=(reader&&) noexcept = default;

		/// \name Reading
		/// @{

		/// \brief Fills the given buffer with the next bytes of the stream.
		///
		/// \remark Previously peeked bytes are delivered first. A zero-length request always
		///		succeeds, even when no source is bound.
		/// \exception seqio::unbound_stream Thrown when no source is bound.
		/// \exception seqio::buffer_exhausted Thrown when the source ends before the buffer is
		///		full. Bytes obtained before the failure remain counted by \ref tell.
		/// \param a_dst The buffer to read bytes into.
		void read_bytes(std::span<std::byte> a_dst);

		/// \copybrief read_bytes(std::span<std::byte>)
		///
		/// \param a_count The number of bytes to read.
		/// \return The bytes read.
		[[nodiscard]] std::vector<std::byte> read_bytes(std::size_t a_count);

		/// \brief Reads a single byte.
		[[nodiscard]] std::byte read_byte();

		/// \brief Reads up to `a_dst.size()` bytes with at most one call to the source.
		///
		/// \remark Pending peeked bytes are handed out before the source is consulted.
		/// \param a_dst The buffer to read bytes into.
		/// \return The number of bytes read, `0` at the end of input.
		std::size_t read_some(std::span<std::byte> a_dst);

		/// \brief Consumes and drops the given number of bytes.
		///
		/// \exception seqio::buffer_exhausted Thrown when the source ends early.
		/// \param a_count The number of bytes to skip.
		void discard(std::size_t a_count);

		/// \brief Batch reads the given values, using the default endian format.
		///
		/// \exception seqio::endian_unset Thrown when a multi-byte value is requested and no
		///		default endian format is set.
		/// \tparam Args The values to be read.
		/// \return The values read.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
			[[nodiscard]] std::tuple<Args...> read()
		{
			std::tuple<Args...> values;
			std::apply([&](Args&... a_args) { this->read(a_args...); }, values);
			return values;
		}

		/// \brief Batch reads the given values with the given endian format.
		///
		/// \tparam Args The values to be read.
		/// \param a_endian The endian format the values are stored in.
		/// \return The values read.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
			[[nodiscard]] std::tuple<Args...> read(std::endian a_endian)
		{
			std::tuple<Args...> values;
			std::apply([&](Args&... a_args) { this->read(a_endian, a_args...); }, values);
			return values;
		}

		/// \brief Batch reads into the given values, using the default endian format.
		///
		/// \param a_args The values to be read.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
		void read(Args&... a_args)
		{
			this->require_source("reader::read: no source is bound");
			if constexpr (((sizeof(Args) == 1) && ...)) {
				this->read(std::endian::native, a_args...);
			} else {
				this->read(
					this->_state.require_endian("reader::read: no endian format is set"),
					a_args...);
			}
		}

		/// \brief Batch reads into the given values with the given endian format.
		///
		/// \param a_endian The endian format the values are stored in.
		/// \param a_args The values to be read.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
		void read(std::endian a_endian, Args&... a_args)
		{
			constexpr auto size = (sizeof(Args) + ...);
			std::array<std::byte, size> buffer{};
			const auto bytes = std::span{ buffer };
			this->read_bytes(bytes);

			std::size_t offset = 0;
			((a_args = seqio::read<Args>(
				  bytes.subspan(offset, sizeof(Args)).template subspan<0, sizeof(Args)>(),
				  a_endian),
				 offset += sizeof(Args)),
				...);
		}

		/// \brief Reads the given value from the reader.
		///
		/// \param a_in The reader to read from.
		/// \param a_value The value to be read.
		/// \return A reference to the reader, for chaining.
		template <concepts::encodable T>
		friend reader& operator>>(
			reader& a_in,
			T& a_value)
		{
			a_in.read(a_value);
			return a_in;
		}

		/// @}

		/// \name Peeking
		/// @{

		/// \brief Copies the next `a_dst.size()` bytes into the given buffer without consuming
		///		them.
		///
		/// \remark Repeated peeks without an intervening read observe the same bytes. Only the
		///		bytes not already buffered are fetched from the source.
		/// \exception seqio::unbound_stream Thrown when no source is bound.
		/// \exception seqio::buffer_exhausted Thrown when the source ends early. The bytes
		///		buffered by earlier peeks are kept.
		/// \param a_dst The buffer to copy the upcoming bytes into.
		void peek(std::span<std::byte> a_dst);

		/// \brief Gets the number of peeked bytes which have not been read yet.
		[[nodiscard]] std::size_t peek_available() const noexcept
		{
			return this->_peek_end - this->_peek_pos;
		}

		/// \brief Ensures the peek buffer has room for `a_count` bytes, counted from the oldest
		///		unread peeked byte, so that a \ref peek of that size does not reallocate.
		///
		/// \remark Unread peeked bytes are moved to the front of the buffer if that makes them fit.
		///		They are kept in order and \ref tell is not changed.
		/// \param a_count The number of bytes, including those already pending, to make room for.
		void reserve_peek(std::size_t a_count);

		/// @}

		/// \name Position
		/// @{

		/// \brief Gets the number of bytes consumed by reads so far.
		[[nodiscard]] seqio::streamoff tell() const noexcept { return this->_state.tell(); }

		/// @}

		/// \name Formatting
		/// @{

		/// \brief Gets the current default endian format.
		[[nodiscard]] std::optional<std::endian> endian() const noexcept { return this->_state.endian(); }

		/// \brief Sets the default endian format. Buffered bytes are unaffected.
		void endian(std::optional<std::endian> a_endian) noexcept { this->_state.endian(a_endian); }

		/// \brief Sets the default endian format values will be read as.
		///
		/// \param a_in The reader to modify.
		/// \param a_endian The new default endian format.
		/// \return A reference to the reader, for chaining.
		friend reader& operator>>(
			reader& a_in,
			std::endian a_endian) noexcept
		{
			a_in.endian(a_endian);
			return a_in;
		}

		/// @}

		/// \name Source management
		/// @{

		/// \brief Checks if a source is bound.
		[[nodiscard]] bool has_source() const noexcept { return this->_source.has_value(); }

		/// \brief Provides access to the bound source.
		[[nodiscard]] seqio::any_source& source() noexcept { return this->_source; }
		/// \copydoc source()
		[[nodiscard]] const seqio::any_source& source() const noexcept { return this->_source; }

		/// \brief Rebinds the reader to a new source and endian format.
		///
		/// \post \ref tell() is `0` and any peeked bytes from the old source are dropped.
		/// \param a_source The new source.
		/// \param a_endian The new default endian format.
		void reset(
			seqio::any_source a_source,
			std::optional<std::endian> a_endian) noexcept;

		/// @}

	private:
		void require_source(const char* a_what) const;

		[[nodiscard]] auto pending_peek() const noexcept
			-> std::span<const std::byte>
		{
			return std::span{ this->_peek }.subspan(this->_peek_pos, this->peek_available());
		}

		void consume_peek(std::size_t a_count) noexcept;

		seqio::any_source _source;
		components::stream_state _state;
		std::vector<std::byte> _peek;
		std::size_t _peek_pos{ 0 };
		std::size_t _peek_end{ 0 };
		std::array<std::byte, scratch_size> _scratch{};
	};
}
