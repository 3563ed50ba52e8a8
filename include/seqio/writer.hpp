#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>

#include "seqio/any_stream.hpp"
#include "seqio/common.hpp"

namespace seqio
{
	/// \brief Encodes bytes and typed values into a byte sink.
	///
	/// \remark A writer is not safe for concurrent use.
	class writer
	{
	public:
		/// \brief The size of the chunks \ref zero_fill writes in.
		static constexpr std::size_t scratch_size = 1024;

		/// \brief Constructs a writer without a sink or endian format.
		writer() noexcept = default;

		/// \brief Constructs a writer bound to the given sink and endian format.
		///
		/// \param a_sink The sink to write into.
		/// \param a_endian The default endian format, or `std::nullopt` for none.
		writer(
			seqio::any_sink a_sink,
			std::optional<std::endian> a_endian) noexcept;

		writer(const writer&) = delete;
		writer(writer&&) noexcept = default;
		~writer() noexcept = default;
		writer& operator=(const writer&) = delete;
		writer& operator=(writer&&) noexcept = default;

		/// \name Writing
		/// @{

		/// \brief Writes every byte of the given buffer.
		///
		/// \remark Short writes are retried until the sink has accepted the whole buffer. A
		///		zero-length write always succeeds, even when no sink is bound.
		/// \exception seqio::unbound_stream Thrown when no sink is bound.
		/// \exception seqio::buffer_exhausted Thrown when the sink stops accepting bytes. Bytes
		///		accepted before the failure remain counted by \ref tell.
		/// \param a_src The buffer to write bytes from.
		void write_bytes(std::span<const std::byte> a_src);

		/// \brief Writes a single byte.
		void write_byte(std::byte a_value);

		/// \brief Writes up to `a_src.size()` bytes with a single call to the sink.
		///
		/// \param a_src The buffer to write bytes from.
		/// \return The number of bytes the sink accepted.
		std::size_t write_some(std::span<const std::byte> a_src);

		/// \brief Writes the given number of zero bytes.
		///
		/// \exception seqio::invalid_argument Thrown when `a_count` is negative, before anything
		///		is written.
		/// \param a_count The number of zero bytes to write.
		void zero_fill(seqio::streamoff a_count);

		/// \brief Writes the given values, using the default endian format.
		///
		/// \exception seqio::endian_unset Thrown when a multi-byte value is written and no
		///		default endian format is set.
		/// \param a_args The values to be written.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
		void write(Args... a_args)
		{
			this->require_sink("writer::write: no sink is bound");
			if constexpr (((sizeof(Args) == 1) && ...)) {
				this->write(std::endian::native, a_args...);
			} else {
				this->write(
					this->_state.require_endian("writer::write: no endian format is set"),
					a_args...);
			}
		}

		/// \brief Writes the given values with the given endian format.
		///
		/// \param a_endian The endian format the values will be written as.
		/// \param a_args The values to be written.
		template <concepts::encodable... Args>
		requires(sizeof...(Args) > 0)
		void write(std::endian a_endian, Args... a_args)
		{
			constexpr auto size = (sizeof(Args) + ...);
			std::array<std::byte, size> buffer{};
			const auto bytes = std::span{ buffer };

			std::size_t offset = 0;
			((seqio::write(
				  bytes.subspan(offset, sizeof(Args)).template subspan<0, sizeof(Args)>(),
				  a_args,
				  a_endian),
				 offset += sizeof(Args)),
				...);

			this->write_bytes(bytes);
		}

		/// \brief Writes the given value into the writer.
		///
		/// \param a_out The writer to write to.
		/// \param a_value The value to be written.
		/// \return A reference to the writer, for chaining.
		template <concepts::encodable T>
		friend writer& operator<<(
			writer& a_out,
			T a_value)
		{
			a_out.write(a_value);
			return a_out;
		}

		/// @}

		/// \name Position
		/// @{

		/// \brief Gets the number of bytes the sink has accepted so far.
		[[nodiscard]] seqio::streamoff tell() const noexcept { return this->_state.tell(); }

		/// @}

		/// \name Formatting
		/// @{

		/// \brief Gets the current default endian format.
		[[nodiscard]] std::optional<std::endian> endian() const noexcept { return this->_state.endian(); }

		/// \brief Sets the default endian format.
		void endian(std::optional<std::endian> a_endian) noexcept { this->_state.endian(a_endian); }

		/// \brief Sets the default endian format values will be written as.
		///
		/// \param a_out The writer to modify.
		/// \param a_endian The new default endian format.
		/// \return A reference to the writer, for chaining.
		friend writer& operator<<(
			writer& a_out,
			std::endian a_endian) noexcept
		{
			a_out.endian(a_endian);
			return a_out;
		}

		/// @}

		/// \name Sink management
		/// @{

		/// \brief Checks if a sink is bound.
		[[nodiscard]] bool has_sink() const noexcept { return this->_sink.has_value(); }

		/// \brief Provides access to the bound sink.
		[[nodiscard]] seqio::any_sink& sink() noexcept { return this->_sink; }
		/// \copydoc sink()
		[[nodiscard]] const seqio::any_sink& sink() const noexcept { return this->_sink; }

		/// \brief Rebinds the writer to a new sink and endian format.
		///
		/// \post \ref tell() is `0`.
		/// \param a_sink The new sink.
		/// \param a_endian The new default endian format.
		void reset(
			seqio::any_sink a_sink,
			std::optional<std::endian> a_endian) noexcept;

		/// @}

	private:
		void require_sink(const char* a_what) const;

		seqio::any_sink _sink;
		components::stream_state _state;
		std::array<std::byte, scratch_size> _zeroes{};
	};
}
