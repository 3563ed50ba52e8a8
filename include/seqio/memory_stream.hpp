#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <iterator>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "seqio/common.hpp"

namespace seqio
{
	namespace components
	{
		/// \brief Implements the common interface of every `memory_stream`.
		template <class Container>
		class basic_memory_stream_base :
			public components::basic_seek_stream
		{
		private:
			using super = components::basic_seek_stream;

		public:
			using container_type = Container;
			using super::super;

			/// \brief Default constructs the underlying buffer.
			basic_memory_stream_base() = default;

			/// \brief Copy constructs the underlying buffer.
			///
			/// \param a_container The container to copy from.
			basic_memory_stream_base(const container_type& a_container)  //
				noexcept(std::is_nothrow_copy_constructible_v<container_type>) :
				_buffer(a_container)
			{}

			/// \brief Move constructs the underlying buffer.
			///
			/// \param a_container The container to move from.
			basic_memory_stream_base(container_type&& a_container)  //
				noexcept(std::is_nothrow_move_constructible_v<container_type>) :
				_buffer(std::move(a_container))
			{}

			/// \brief Constructs the underlying buffer, in-place, using the given args.
			///
			/// \param a_args The args to construct the buffer with.
			template <class... Args>
			basic_memory_stream_base(std::in_place_t, Args&&... a_args)  //
				noexcept(std::is_nothrow_constructible_v<container_type, Args&&...>) :
				_buffer(std::forward<Args>(a_args)...)
			{}

			static_assert(
				std::same_as<
					std::byte,
					typename Container::value_type>,
				"container value type must be std::byte");
			static_assert(
				std::same_as<
					std::random_access_iterator_tag,
					typename std::iterator_traits<typename Container::iterator>::iterator_category>,
				"container type must be random access");

			/// \name Buffer management
			/// @{

			/// \brief Provides mutable access to the underlying buffer.
			[[nodiscard]] container_type& rdbuf() noexcept { return this->_buffer; }
			/// \brief Provides immutable access to the underlying buffer.
			[[nodiscard]] const container_type& rdbuf() const noexcept { return this->_buffer; }

			/// @}

		private:
			container_type _buffer;
		};
	}

	/// \brief A byte source which reads from an owned, dynamically sized container.
	///
	/// \tparam Container The container type to use as the underlying buffer.
	template <class Container>
	class basic_memory_source final :
		public components::basic_memory_stream_base<Container>
	{
	private:
		using super = components::basic_memory_stream_base<Container>;

	public:
		using super::super;

		/// \name Reading
		/// @{

		/// \copydoc span_source::read_some
		std::size_t read_some(std::span<std::byte> a_dst) noexcept
		{
			const auto where = this->tell();
			assert(where >= 0);

			const auto& buffer = this->rdbuf();
			const auto pos = static_cast<std::size_t>(where);
			if (pos >= std::size(buffer)) {
				return 0;
			}

			const auto count = std::min(a_dst.size_bytes(), std::size(buffer) - pos);
			std::memcpy(a_dst.data(), std::data(buffer) + pos, count);
			this->seek_relative(static_cast<seqio::streamoff>(count));
			return count;
		}

		/// @}
	};

	/// \brief A byte sink which writes into an owned container, growing it as needed.
	///
	/// \tparam Container The container type to use as the underlying buffer.
	template <class Container>
	class basic_memory_sink final :
		public components::basic_memory_stream_base<Container>
	{
	private:
		using super = components::basic_memory_stream_base<Container>;

	public:
		using container_type = typename super::container_type;
		using super::super;

		/// \name Writing
		/// @{

		/// \brief Writes bytes from the given buffer.
		///
		/// \remark Resizable containers accept every byte. Fixed size containers accept bytes
		///		until they are full.
		/// \param a_src The buffer to write bytes from.
		/// \return The number of bytes accepted.
		std::size_t write_some(std::span<const std::byte> a_src)
		{
			const auto where = this->tell();
			assert(where >= 0);

			auto& buffer = this->rdbuf();
			const auto pos = static_cast<std::size_t>(where);
			auto count = a_src.size_bytes();
			if (const auto wantsz = pos + count;
				wantsz > std::size(buffer)) {
				if constexpr (concepts::resizable<container_type>) {
					buffer.resize(wantsz);
				} else {
					count = pos < std::size(buffer) ? std::size(buffer) - pos : 0;
				}
			}

			if (count > 0) {
				std::memcpy(std::data(buffer) + pos, a_src.data(), count);
			}
			this->seek_relative(static_cast<seqio::streamoff>(count));
			return count;
		}

		/// @}
	};

	using memory_source = seqio::basic_memory_source<std::vector<std::byte>>;
	using memory_sink = seqio::basic_memory_sink<std::vector<std::byte>>;
}
