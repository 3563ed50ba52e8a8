#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

#include "seqio/common.hpp"

namespace seqio
{
#ifndef DOXYGEN
	namespace detail
	{
		class erased_stream_base
		{
		public:
			virtual ~erased_stream_base() noexcept = default;
		};

		template <class Stream, class Base>
		class erased_stream :
			public Base
		{
		public:
			using stream_type = Stream;

			erased_stream(const erased_stream&) = delete;
			erased_stream& operator=(const erased_stream&) = delete;

			template <class... Args>
			erased_stream(Args&&... a_args)  //
				noexcept(std::is_nothrow_constructible_v<stream_type, Args&&...>) :
				_stream(std::forward<Args>(a_args)...)
			{}

			[[nodiscard]] auto get() noexcept -> stream_type& { return this->_stream; }
			[[nodiscard]] auto get() const noexcept -> const stream_type& { return this->_stream; }

		protected:
			// a std::reference_wrapper borrows the stream instead of owning it
			[[nodiscard]] auto target() noexcept
				-> std::unwrap_reference_t<stream_type>&
			{
				return this->_stream;
			}

			stream_type _stream;
		};

		class erased_source_base :
			public detail::erased_stream_base
		{
		public:
			virtual std::size_t read_some(std::span<std::byte> a_dst) = 0;
		};

		template <class Stream>
		class erased_source :
			public detail::erased_stream<Stream, detail::erased_source_base>
		{
		private:
			using super = detail::erased_stream<Stream, detail::erased_source_base>;

		public:
			using super::super;

#	if !SEQIO_COMP_CLANG  // WORKAROUND: LLVM-44833
			static_assert(
				concepts::byte_source<std::unwrap_reference_t<Stream>>,
				"stream type does not meet the minimum requirements for being a byte source");
#	endif

			std::size_t read_some(std::span<std::byte> a_dst) override
			{
				return this->target().read_some(a_dst);
			}
		};

		class erased_sink_base :
			public detail::erased_stream_base
		{
		public:
			virtual std::size_t write_some(std::span<const std::byte> a_src) = 0;
		};

		template <class Stream>
		class erased_sink :
			public detail::erased_stream<Stream, detail::erased_sink_base>
		{
		private:
			using super = detail::erased_stream<Stream, detail::erased_sink_base>;

		public:
			using super::super;

			static_assert(
				concepts::byte_sink<std::unwrap_reference_t<Stream>>,
				"stream type does not meet the minimum requirements for being a byte sink");

			std::size_t write_some(std::span<const std::byte> a_src) override
			{
				return this->target().write_some(a_src);
			}
		};
	}
#endif

	namespace components
	{
		/// \brief Implements the common interface of every `any_source` and `any_sink`.
		template <
			class StreamBase,
			template <class> class StreamErased>
		class any_stream_base
		{
		private:
			template <class S>
			static constexpr bool is_foreign_v =
				!std::derived_from<std::remove_cvref_t<S>, any_stream_base>;

		public:
			/// \brief Constructs the stream without any active underlying stream.
			any_stream_base() noexcept = default;

			/// \brief Uses the given stream as the active underlying stream.
			///
			/// \remark Pass a `std::reference_wrapper` (i.e. `std::ref(stream)`) to borrow the
			///		stream instead of taking ownership of it.
			/// \param a_stream The underlying stream to copy or move from.
			template <class S>
			requires(is_foreign_v<S>)
			any_stream_base(S&& a_stream) :
				any_stream_base(std::in_place_type<std::remove_cvref_t<S>>, std::forward<S>(a_stream))
			{}

			/// \name Modifiers
			/// @{

			/// \copydoc emplace()
			template <class S, class... Args>
			any_stream_base(std::in_place_type_t<S>, Args&&... a_args)
			{
				this->emplace<S>(std::forward<Args>(a_args)...);
			}

			/// \brief Constructs the given underlying stream in-place, using the given arguments.
			///
			/// \tparam S The stream to construct in-place.
			/// \tparam Args The arg types.
			/// \param a_args The arguments to use to construct the underlying stream in-place.
			template <class S, class... Args>
			void emplace(Args&&... a_args)
			{
				this->_stream = std::make_unique<StreamErased<S>>(std::forward<Args>(a_args)...);
			}

			/// \brief Destroys the underlying stream, if there is any.
			///
			/// \post \ref has_value() will be `false`.
			void reset() noexcept { this->_stream.reset(); }

			/// @}

			/// \name Observers
			/// @{

			/// \copydoc get() const
			template <class S>
			[[nodiscard]] S& get()
			{
				return const_cast<S&>(std::as_const(*this).template get<S>());
			}

			/// \copydoc get_if()
			///
			/// \pre \ref has_value() _must_ be `true`.
			/// \exception std::bad_cast Thrown if the underlying stream is _not_ of the given type.
			template <class S>
			[[nodiscard]] const S& get() const
			{
				assert(this->has_value());
				auto& erased = dynamic_cast<const StreamErased<S>&>(*this->_stream);
				return erased.get();
			}

			/// \copydoc get_if() const
			template <class S>
			[[nodiscard]] S* get_if() noexcept
			{
				return const_cast<S*>(std::as_const(*this).template get_if<S>());
			}

			/// \brief Attempts to get the underlying stream as the given type.
			///
			/// \tparam S The type to attempt to cast to the underlying stream to.
			/// \return The underlying stream.
			template <class S>
			[[nodiscard]] const S* get_if() const noexcept
			{
				const auto erased = dynamic_cast<const StreamErased<S>*>(this->_stream.get());
				return erased ? std::addressof(erased->get()) : nullptr;
			}

			/// \brief Checks if there is an active underlying stream.
			///
			/// \return `true` if there _is_ an active underlying stream, `false` otherwise.
			[[nodiscard]] bool has_value() const noexcept { return this->_stream != nullptr; }

			/// \copydoc has_value()
			explicit operator bool() const noexcept { return this->has_value(); }

			/// @}

		protected:
			std::unique_ptr<StreamBase> _stream;
		};
	}

	/// \brief A polymorphic, owning or borrowing handle to any byte source.
	class any_source final :
		public components::any_stream_base<
			detail::erased_source_base,
			detail::erased_source>
	{
	private:
		using super = components::any_stream_base<
			detail::erased_source_base,
			detail::erased_source>;

	public:
		using super::super;

		/// \name Reading
		/// @{

		/// \brief Forwards a single read to the underlying source.
		///
		/// \pre \ref has_value() _must_ be `true`.
		/// \param a_dst The buffer to read bytes into.
		/// \return The number of bytes read, `0` at the end of input.
		std::size_t read_some(std::span<std::byte> a_dst) { return this->_stream->read_some(a_dst); }

		/// @}
	};

	/// \brief A polymorphic, owning or borrowing handle to any byte sink.
	class any_sink final :
		public components::any_stream_base<
			detail::erased_sink_base,
			detail::erased_sink>
	{
	private:
		using super = components::any_stream_base<
			detail::erased_sink_base,
			detail::erased_sink>;

	public:
		using super::super;

		/// \name Writing
		/// @{

		/// \brief Forwards a single write to the underlying sink.
		///
		/// \pre \ref has_value() _must_ be `true`.
		/// \param a_src The buffer to write bytes from.
		/// \return The number of bytes the sink accepted.
		std::size_t write_some(std::span<const std::byte> a_src) { return this->_stream->write_some(a_src); }

		/// @}
	};
}
