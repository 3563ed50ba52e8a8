#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <optional>
#include <span>
#include <type_traits>

static_assert(CHAR_BIT == 8, "unsupported platform");
static_assert(
	std::endian::native == std::endian::little || std::endian::native == std::endian::big,
	"unsupported platform");
static_assert(
	std::numeric_limits<float>::is_iec559 && std::numeric_limits<double>::is_iec559,
	"unsupported platform");

#if defined(__clang__)
#	define SEQIO_COMP_CLANG true
#else
#	define SEQIO_COMP_CLANG false
#endif

#if !SEQIO_COMP_CLANG && defined(__GNUC__)
#	define SEQIO_COMP_GNUC true
#else
#	define SEQIO_COMP_GNUC false
#endif

#if defined(__EDG__)
#	define SEQIO_COMP_EDG true
#else
#	define SEQIO_COMP_EDG false
#endif

#if !SEQIO_COMP_CLANG && !SEQIO_COMP_EDG && defined(_MSC_VER)
#	define SEQIO_COMP_MSVC true
#else
#	define SEQIO_COMP_MSVC false
#endif

#if SEQIO_COMP_GNUC || SEQIO_COMP_CLANG
#	define SEQIO_VISIBLE __attribute__((visibility("default")))
#else
#	define SEQIO_VISIBLE
#endif

#if SEQIO_COMP_GNUC || SEQIO_COMP_CLANG
#	define SEQIO_BSWAP16 __builtin_bswap16
#	define SEQIO_BSWAP32 __builtin_bswap32
#	define SEQIO_BSWAP64 __builtin_bswap64
#elif SEQIO_COMP_MSVC || SEQIO_COMP_EDG
#	define SEQIO_BSWAP16 _byteswap_ushort
#	define SEQIO_BSWAP32 _byteswap_ulong
#	define SEQIO_BSWAP64 _byteswap_uint64
#else
#	error "unsupported compiler"
#endif

namespace seqio
{
	/// \brief A signed integral type used to count stream positions.
	using streamoff = long long;

	namespace concepts
	{
#ifdef DOXYGEN
		/// \brief Constraint for basic integer types or enums.
		template <class T>
		struct integral
		{};
#else
		template <class T>
		concept integral =
			!std::same_as<T, std::endian> &&
			(  //
				std::is_enum_v<T> ||

				std::same_as<T, char> ||

				std::same_as<T, signed char> ||
				std::same_as<T, signed short int> ||
				std::same_as<T, signed int> ||
				std::same_as<T, signed long int> ||
				std::same_as<T, signed long long int> ||

				std::same_as<T, unsigned char> ||
				std::same_as<T, unsigned short int> ||
				std::same_as<T, unsigned int> ||
				std::same_as<T, unsigned long int> ||
				std::same_as<T, unsigned long long int>);
#endif

#ifdef DOXYGEN
		/// \brief Constraint for IEEE-754 single and double precision types.
		template <class T>
		struct floating_point
		{};
#else
		template <class T>
		concept floating_point =
			std::same_as<T, float> ||
			std::same_as<T, double>;
#endif

#ifdef DOXYGEN
		/// \brief Constraint for every type which can be encoded by a stream.
		template <class T>
		struct encodable
		{};
#else
		template <class T>
		concept encodable =
			concepts::integral<T> ||
			concepts::floating_point<T>;
#endif

#ifdef DOXYGEN
		/// \brief A constraint for container types which can be resized.
		///
		/// \remark
		/// * `T` must provide the following methods:
		///		* `void resize(T::size_type a_count)`
		template <class T>
		struct resizable
		{};
#else
		template <class T>
		concept resizable =
			requires(T a_container, typename T::size_type a_count)
		{
			{ a_container.resize(a_count) };
		};
#endif

#ifdef DOXYGEN
		/// \brief A constraint for types which produce bytes.
		///
		/// \remark
		/// * `T` must provide the following methods:
		///		* `std::size_t read_some(std::span<std::byte> a_dst)`
		/// * `read_some` may return fewer bytes than requested. Returning `0` for a non-empty
		///		request signals the end of input. Any other failure must be thrown.
		template <class T>
		struct byte_source
		{};
#else
		template <class T>
		concept byte_source =
			requires(T& a_ref, std::span<std::byte> a_bytes)
		{
			// clang-format off
			{ a_ref.read_some(a_bytes) } -> std::same_as<std::size_t>;
			// clang-format on
		};
#endif

#ifdef DOXYGEN
		/// \brief A constraint for types which consume bytes.
		///
		/// \remark
		/// * `T` must provide the following methods:
		///		* `std::size_t write_some(std::span<const std::byte> a_src)`
		/// * `write_some` may accept fewer bytes than offered. Hard failures must be thrown.
		template <class T>
		struct byte_sink
		{};
#else
		template <class T>
		concept byte_sink =
			requires(T& a_ref, std::span<const std::byte> a_bytes)
		{
			// clang-format off
			{ a_ref.write_some(a_bytes) } -> std::same_as<std::size_t>;
			// clang-format on
		};
#endif
	}

#ifndef DOXYGEN
	namespace detail::type_traits
	{
		template <class T>
		using integral_type = std::conditional_t<
			std::is_enum_v<T>,
			std::underlying_type<T>,
			std::type_identity<T>>;

		template <class T>
		using integral_type_t = typename integral_type<T>::type;

		template <class T>
		using bits_type_t = std::conditional_t<
			sizeof(T) == 4,
			std::uint32_t,
			std::uint64_t>;
	}
#endif

	namespace endian
	{
		/// \brief Reverses the endian format of a given input.
		///
		/// \param a_value The value to reverse.
		/// \return The reversed value.
		template <class T>
		[[nodiscard]] T reverse(T a_value) noexcept
		{
			static_assert(concepts::integral<T>);

			using integral_t = detail::type_traits::integral_type_t<T>;
			const auto value = static_cast<integral_t>(a_value);
			if constexpr (sizeof(T) == 1) {
				return static_cast<T>(value);
			} else if constexpr (sizeof(T) == 2) {
				return static_cast<T>(SEQIO_BSWAP16(value));
			} else if constexpr (sizeof(T) == 4) {
				return static_cast<T>(SEQIO_BSWAP32(value));
			} else if constexpr (sizeof(T) == 8) {
				return static_cast<T>(SEQIO_BSWAP64(value));
			} else {
				static_assert(sizeof(T) && false, "unsupported integral size");
			}
		}

		/// \brief Loads the given type from the given buffer, with the given endian format,
		///		into the native endian format.
		///
		/// \remark Floating point values are reinterpreted from their bit pattern. NaN and
		///		infinity payloads are passed through untouched.
		/// \param a_src The buffer to load from.
		/// \return The value loaded from the given buffer.
		template <std::endian E, class T>
		[[nodiscard]] T load(std::span<const std::byte, sizeof(T)> a_src) noexcept
		{
			static_assert(concepts::encodable<T>);

			if constexpr (concepts::floating_point<T>) {
				using bits_t = detail::type_traits::bits_type_t<T>;
				return std::bit_cast<T>(endian::load<E, bits_t>(a_src));
			} else {
				T value{};
				std::memcpy(&value, a_src.data(), sizeof(T));
				return std::endian::native == E ? value : endian::reverse(value);
			}
		}

		/// \brief Stores the given type into the given buffer, from the native endian format
		///		into the given endian format.
		///
		/// \param a_dst The buffer to store into.
		/// \param a_value The value to be stored.
		template <std::endian E, class T>
		void store(std::span<std::byte, sizeof(T)> a_dst, T a_value) noexcept
		{
			static_assert(concepts::encodable<T>);

			if constexpr (concepts::floating_point<T>) {
				using bits_t = detail::type_traits::bits_type_t<T>;
				endian::store<E>(a_dst, std::bit_cast<bits_t>(a_value));
			} else {
				if constexpr (std::endian::native != E) {
					a_value = reverse(a_value);
				}

				std::memcpy(a_dst.data(), &a_value, sizeof(T));
			}
		}
	}

#ifndef DOXYGEN
	namespace detail
	{
		[[noreturn]] inline void declare_unreachable()
		{
			assert(false);
#	if SEQIO_COMP_GNUC || SEQIO_COMP_CLANG
			__builtin_unreachable();
#	elif SEQIO_COMP_MSVC || SEQIO_COMP_EDG
			__assume(false);
#	else
			static_assert(false, "unsupported compiler");
#	endif
		}
	}
#endif

	/// \copydoc endian::load()
	///
	/// \param a_endian The endian format the given value is stored in.
	template <class T>
	[[nodiscard]] T read(
		std::span<const std::byte, sizeof(T)> a_src,
		std::endian a_endian)
	{
		static_assert(concepts::encodable<T>);

		switch (a_endian) {
		case std::endian::little:
			return endian::load<std::endian::little, T>(a_src);
		case std::endian::big:
			return endian::load<std::endian::big, T>(a_src);
		default:
			detail::declare_unreachable();
		}
	}

	/// \copydoc endian::store()
	///
	/// \param a_endian The endian format to store the given value in.
	template <class T>
	void write(
		std::span<std::byte, sizeof(T)> a_dst,
		T a_value,
		std::endian a_endian)
	{
		static_assert(concepts::encodable<T>);

		switch (a_endian) {
		case std::endian::little:
			endian::store<std::endian::little>(a_dst, a_value);
			break;
		case std::endian::big:
			endian::store<std::endian::big>(a_dst, a_value);
			break;
		default:
			detail::declare_unreachable();
		}
	}

	/// \brief The base exception type for all `seqio` exceptions.
	class SEQIO_VISIBLE exception :
		public std::exception
	{
	public:
		/// \brief Constructs an exception with the given message.
		exception(const char* a_what) noexcept :
			_what(a_what)
		{}

		/// \brief Gets the stored message from the given exception.
		///
		/// \return The stored error message.
		const char* what() const noexcept override { return _what; }

	private:
		const char* _what{ nullptr };
	};

	/// \brief An exception which indicates the underlying source or sink ran out before a
	///		request could be completed.
	class SEQIO_VISIBLE buffer_exhausted :
		public seqio::exception
	{
	public:
		buffer_exhausted() noexcept :
			seqio::exception("unexpected end of input")
		{}

		buffer_exhausted(const char* a_what) noexcept :
			seqio::exception(a_what)
		{}
	};

	/// \brief An exception which indicates an operation was attempted on a stream with no
	///		bound source or sink.
	class SEQIO_VISIBLE unbound_stream :
		public seqio::exception
	{
	public:
		using seqio::exception::exception;
	};

	/// \brief An exception which indicates a multi-byte value was encoded or decoded while
	///		no endian format was set.
	class SEQIO_VISIBLE endian_unset :
		public seqio::exception
	{
	public:
		using seqio::exception::exception;
	};

	/// \brief An exception which indicates an argument was rejected before any I/O happened.
	class SEQIO_VISIBLE invalid_argument :
		public seqio::exception
	{
	public:
		using seqio::exception::exception;
	};

	namespace components
	{
		/// \brief The position and default endian format carried by every reader and writer.
		class stream_state
		{
		public:
			stream_state() noexcept = default;

			explicit stream_state(std::optional<std::endian> a_endian) noexcept :
				_endian(a_endian)
			{}

			/// \name Position
			/// @{

			/// \brief Gets the number of bytes transferred so far.
			///
			/// \return The current stream position.
			[[nodiscard]] seqio::streamoff tell() const noexcept { return this->_pos; }

			/// \brief Advances the position by the given number of bytes.
			void advance(std::size_t a_count) noexcept
			{
				this->_pos += static_cast<seqio::streamoff>(a_count);
			}

			/// @}

			/// \name Formatting
			/// @{

			/// \brief Gets the current default endian format.
			///
			/// \return The default endian format, or `std::nullopt` if none is set.
			[[nodiscard]] std::optional<std::endian> endian() const noexcept { return this->_endian; }

			/// \brief Sets the default endian format.
			///
			/// \param a_endian The new endian format.
			void endian(std::optional<std::endian> a_endian) noexcept { this->_endian = a_endian; }

			/// \brief Gets the current default endian format, or throws if there is none.
			///
			/// \exception seqio::endian_unset Thrown when no endian format is set.
			/// \param a_what The message to report on failure.
			[[nodiscard]] std::endian require_endian(const char* a_what) const
			{
				if (!this->_endian) {
					throw seqio::endian_unset(a_what);
				}
				return *this->_endian;
			}

			/// @}

			/// \brief Rewinds the position to zero and replaces the endian format.
			void reset(std::optional<std::endian> a_endian) noexcept
			{
				this->_pos = 0;
				this->_endian = a_endian;
			}

		private:
			seqio::streamoff _pos{ 0 };
			std::optional<std::endian> _endian;
		};

		/// \brief Implements the cursor of in-memory sources and sinks.
		class basic_seek_stream
		{
		public:
			/// \name Position
			/// @{

			/// \brief Seek to an absolute position in the stream (i.e. from the beginning).
			///
			/// \param a_pos The absolute position to seek to.
			void seek_absolute(seqio::streamoff a_pos) noexcept
			{
				this->_pos = std::max<seqio::streamoff>(a_pos, 0);
			}

			/// \brief Seek to a position in the stream relative to the current position.
			///
			/// \param a_off The offset to seek to.
			void seek_relative(seqio::streamoff a_off) noexcept
			{
				this->seek_absolute(this->_pos + a_off);
			}

			/// \brief Gets the current stream position.
			///
			/// \return The current stream position.
			[[nodiscard]] seqio::streamoff tell() const noexcept { return this->_pos; }

			/// @}

		private:
			seqio::streamoff _pos{ 0 };
		};
	}
}
