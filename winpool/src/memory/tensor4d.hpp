/*******************************************************************************
 * Copyright (c) 2026 Advanced Micro Devices, Inc. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *******************************************************************************/
#ifndef _WINPOOL_TENSOR4D_HPP_
#define _WINPOOL_TENSOR4D_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/winpool_global.hpp"
#include "common/data_types.hpp"

namespace winpool {
/** @namespace winpool::memory
 *  @brief A namespace for tensors and their storage.
 */
namespace memory {

using namespace winpool::common;
using namespace winpool::error_handling;

/** @class tensor4d_t
 *  @brief A dense row-major tensor with a runtime data type.
 *
 * Pooling operates on 4-d tensors with axes (batch, channel, height, width),
 * hence the name. The rank is not fixed at creation so that an operator can
 * reject a tensor of wrong rank with a proper status instead of the tensor
 * refusing to exist.
 *
 * A tensor is created by chaining "set_" functions with @c create().
 * @code
 * auto input = tensor4d_t()
 *              .set_size({2, 3, 8, 8})
 *              .set_data_type(data_type_t::f32)
 *              .set_name("input")
 *              .create();
 * if (input.get_last_status() != status_t::success)
 *   // invalid tensor
 * @endcode
 *
 * Storage is either allocated by @c create() (zero filled, 64 byte aligned),
 * or borrowed from the caller with @c set_storage(void*, uint64_t). Copies of
 * a tensor share storage; borrowed storage is never freed by the tensor.
 */
class tensor4d_t final {
public:
  /** @brief Index type */
  using index_type     = uint64_t;
  /** @brief Index vector type */
  using index_vec_type = std::vector<index_type>;

  /** @brief Memory alignment of allocated storage */
  static constexpr uint64_t storage_alignment = 64;

  /** @name Constructors, Destructors and Assignment
   */
  /**@{*/
  tensor4d_t();
  tensor4d_t(const tensor4d_t& other_)            = default;
  tensor4d_t& operator=(const tensor4d_t& other_) = default;
  tensor4d_t(tensor4d_t&& other_)                 = default;
  tensor4d_t& operator=(tensor4d_t&& other_)      = default;
  /**@}*/

  /** @name Meta data
   */
  /**@{*/
  /** @brief Set tensor size. Rank is the length of the size vector. */
  tensor4d_t&    set_size(index_vec_type size_);

  /** @brief Get tensor size */
  index_vec_type get_size() const;

  /** @brief Get tensor size along an axis */
  index_type     get_size(uint32_t axis_) const;

  /** @brief Get tensor rank */
  uint32_t       get_dim() const;

  /** @brief Get tensor stride (elements), computed by @c create() */
  index_vec_type get_stride() const;

  /** @brief Set tensor data type */
  tensor4d_t&    set_data_type(data_type_t data_type_);

  /** @brief Get tensor data type */
  data_type_t    get_data_type() const;

  /** @brief Set tensor name, used in logs */
  tensor4d_t&    set_name(std::string name_);

  /** @brief Get tensor name */
  std::string    get_name() const;
  /**@}*/

  /** @name Storage
   */
  /**@{*/
  /** @brief Borrow a caller owned buffer.
   *
   * @param raw_ptr_  : raw pointer to a memory buffer.
   * @param sz_bytes_ : buffer size in bytes; @c create() fails if it is
   *                    smaller than the tensor needs.
   */
  tensor4d_t&    set_storage(void* raw_ptr_, uint64_t sz_bytes_);

  /** @brief Get element count */
  uint64_t       get_nelem() const;

  /** @brief Get buffer size in bytes */
  uint64_t       get_buffer_sz_bytes() const;

  /** @brief Get the raw handle to tensor memory buffer */
  void*          get_raw_handle_unsafe() const;

  /** @brief Get a const raw handle to tensor memory buffer */
  const void*    get_raw_handle_const() const;

  /** @brief Typed pointer to the buffer.
   *
   * Throws if T does not match the tensor data type.
   */
  template<typename T>
  T*             data() const;
  /**@}*/

  /** @name Element access
   */
  /**@{*/
  /** @brief Compute offset (elements) of an index. */
  uint64_t       compute_offset(const index_vec_type& index_) const;

  /** @brief Get element converted to float.
   *
   * Throws for an out of range index or an invalid tensor.
   */
  float          at(const index_vec_type& index_) const;

  /** @brief Set element from float, converted to the tensor data type.
   *
   * Throws for an out of range index or an invalid tensor.
   */
  void           set_at(const index_vec_type& index_, float value_);
  /**@}*/

  /** @name Create and Reset
   */
  /**@{*/
  /** @brief Validate meta data, compute strides and allocate storage.
   *
   * Extents may be zero, giving a valid tensor without storage. Fails with
   * memory_bad_size when the element count or the byte size does not fit
   * in int64.
   */
  tensor4d_t&    create();

  /** @brief Reset meta data and release storage. */
  void           reset();

  /** @brief Status of the last create() */
  status_t       get_last_status() const;

  /** @brief True if created successfully */
  bool           is_valid() const;

  /** @brief Check if another tensor has the same size and data type */
  bool           is_alike(const tensor4d_t& other_) const;

  /** @brief Human readable tensor description */
  std::string    tensor_info() const;
  /**@}*/

private:
  status_t       size_sanity_check() const;
  status_t       index_sanity_check(const index_vec_type& index_) const;

  index_vec_type         size;          /**< Tensor size */
  index_vec_type         stride;        /**< Row-major strides */
  uint64_t               nelem;         /**< Number of elements */
  data_type_t            data_type;     /**< Tensor data type */
  std::string            name;          /**< Tensor name */
  std::shared_ptr<void>  storage;       /**< Owned or borrowed buffer */
  void                  *borrowed_ptr;  /**< Borrowed buffer, if any */
  uint64_t               borrowed_sz;   /**< Borrowed buffer size in bytes */
  status_t               status;        /**< Status of the last create() */
};

template<typename T>
T* tensor4d_t::data() const {
  if (!is_valid()) {
    EXCEPTION_WITH_LOC("data access on invalid tensor < " + name + " >.");
  }
  if (data_traits<std::remove_const_t<T>>::data_type != data_type) {
    EXCEPTION_WITH_LOC("data type mismatch accessing tensor < " + name + " >.");
  }
  return static_cast<T*>(storage.get());
}

} //memory

namespace interface {
using tensor4d_t = winpool::memory::tensor4d_t;
} //export

} //winpool
#endif
