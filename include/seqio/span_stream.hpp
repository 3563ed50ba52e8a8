#pragma once

#include <cstddef>
#include <span>

#include "seqio/common.hpp"

namespace seqio
{
	namespace components
	{
		/// \brief Implements the common interface of every `span_stream`.
		template <class T>
		class span_stream_base :
			public components::basic_seek_stream
		{
		private:
			using super = components::basic_seek_stream;

		public:
			using super::super;

			/// \brief Constructs the stream without an underlying buffer.
			span_stream_base() noexcept = default;

			/// \brief Constructs the stream using the given span as the underlying buffer.
			span_stream_base(std::span<T> a_span) noexcept :
				_buffer(a_span)
			{}

			/// \name Buffer management
			/// @{

			/// \brief Provides mutable access to the underlying buffer.
			///
			/// \return The underlying buffer.
			[[nodiscard]] auto rdbuf() noexcept
				-> std::span<T> { return this->_buffer; }

			/// \brief Provides immutable access to the underlying buffer.
			///
			/// \return The underlying buffer.
			[[nodiscard]] auto rdbuf() const noexcept
				-> std::span<const T> { return this->_buffer; }

			/// \brief Gets the number of bytes between the cursor and the end of the buffer.
			[[nodiscard]] std::size_t remaining() const noexcept
			{
				const auto where = static_cast<std::size_t>(this->tell());
				return where < this->_buffer.size() ? this->_buffer.size() - where : 0;
			}

			/// @}

		private:
			std::span<T> _buffer;
		};
	}

	/// \brief A byte source which composes a non-owning view over a contiguous block of memory.
	class span_source final :
		public components::span_stream_base<const std::byte>
	{
	private:
		using super = components::span_stream_base<const std::byte>;

	public:
		using super::super;

		/// \name Reading
		/// @{

		/// \brief Reads up to `a_dst.size()` bytes into the given buffer.
		///
		/// \param a_dst The buffer to read bytes into.
		/// \return The number of bytes read, `0` once the buffer has been exhausted.
		std::size_t read_some(std::span<std::byte> a_dst) noexcept;

		/// @}
	};

	/// \brief A byte sink which composes a non-owning view over a contiguous block of memory.
	///
	/// \remark Writes which run past the end of the buffer are accepted partially. Once the
	///		buffer is full, no further bytes are accepted.
	class span_sink final :
		public components::span_stream_base<std::byte>
	{
	private:
		using super = components::span_stream_base<std::byte>;

	public:
		using super::super;

		/// \name Writing
		/// @{

		/// \brief Writes up to `a_src.size()` bytes from the given buffer.
		///
		/// \param a_src The buffer to write bytes from.
		/// \return The number of bytes accepted.
		std::size_t write_some(std::span<const std::byte> a_src) noexcept;

		/// @}
	};
}
