// This file is part of zflate project
//
// See zflate.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZFLATE_SUPPORT_LOOKUPTABLE_P_H_INCLUDED
#define ZFLATE_SUPPORT_LOOKUPTABLE_P_H_INCLUDED

#include <zflate/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup zflate_internal
//! \{

namespace zf {

//! \name Compile-Time Lookup Table
//! \{

//! Struct that holds `N` items of `T` type - output of lookup table generators.
template<typename T, size_t N>
struct LookupTable {
  T data[N];

  ZF_INLINE_CONSTEXPR size_t size() const noexcept { return N; }
  ZF_INLINE_CONSTEXPR const T& operator[](size_t i) const noexcept { return data[i]; }
};

namespace Internal {

template<typename T, size_t N, class Gen, size_t... Indexes>
ZF_INLINE_CONSTEXPR LookupTable<T, N> make_lookup_table_impl(std::index_sequence<Indexes...>) noexcept {
  return LookupTable<T, N> {{ T(Gen::value(Indexes))... }};
}

} // {Internal}

//! Creates a lookup table of `LookupTable<T[N]>` by using the generator `Gen`.
template<typename T, size_t N, class Gen>
static ZF_INLINE_CONSTEXPR LookupTable<T, N> make_lookup_table() noexcept {
  // Make sure the table is a constant expression - we never want to have it runtime initialized.
  constexpr LookupTable<T, N> table = Internal::make_lookup_table_impl<T, N, Gen>(std::make_index_sequence<N>{});

  return table;
}

//! \}

} // {zf}

//! \}
//! \endcond

#endif // ZFLATE_SUPPORT_LOOKUPTABLE_P_H_INCLUDED
