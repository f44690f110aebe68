#pragma once

#include <type_traits>

namespace whohas::util {

template <auto T, auto...> constexpr auto deferred_value = T;

template <typename T, typename = std::enable_if_t<std::is_integral_v<T> &&
                                                  std::is_unsigned_v<T>>>
T constexpr hton(T value) {

#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return value;
#else
  constexpr auto t_size = sizeof(T);
  if constexpr (t_size == 1) {
    return value;
  } else if constexpr (t_size == 2) {
    return __builtin_bswap16(value);
  } else if constexpr (t_size == 4) {
    return __builtin_bswap32(value);
  } else if constexpr (t_size == 8) {
    return __builtin_bswap64(value);
  } else {
    // Use a deferred false static_assert to avoid compilation errors
    static_assert(deferred_value<false>, "Unsupported type for hton");
  }
#endif
}

template <typename T, typename = std::enable_if_t<std::is_integral_v<T> &&
                                                  std::is_unsigned_v<T>>>
T constexpr ntoh(T value) {
  return hton(value);
}

/**
 * @brief Network mask with the top prefix_len bits set
 *
 * @param prefix_len Number of leading one bits, at most the width of T
 */
template <typename T, typename = std::enable_if_t<std::is_integral_v<T> &&
                                                  std::is_unsigned_v<T>>>
constexpr T prefix_mask(unsigned prefix_len) {
  constexpr unsigned bits = sizeof(T) * 8;
  // Shifting by the full width is undefined
  if (prefix_len == 0) {
    return 0;
  }
  return static_cast<T>(~T{0} << (bits - prefix_len));
}

} // namespace whohas::util
