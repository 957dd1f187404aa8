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
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include "tensor4d.hpp"

namespace winpool {
namespace memory {

using namespace winpool::common;
using namespace winpool::error_handling;

tensor4d_t::tensor4d_t()
  :size{}, stride{}, nelem{0}, data_type{data_type_t::f32}, name{"tensor"},
   storage{}, borrowed_ptr{nullptr}, borrowed_sz{0},
   status{status_t::failure} {
}

tensor4d_t &tensor4d_t::set_size(index_vec_type size_) {
  if (is_valid()) {
    EXCEPTION_WITH_LOC("attempt to resize created tensor < " + name + " >.");
  }
  size = std::move(size_);
  return *this;
}

tensor4d_t::index_vec_type tensor4d_t::get_size() const {
  return size;
}

tensor4d_t::index_type tensor4d_t::get_size(uint32_t axis_) const {
  if (axis_ >= size.size()) {
    EXCEPTION_WITH_LOC("axis out of range for tensor < " + name + " >.");
  }
  return size[axis_];
}

uint32_t tensor4d_t::get_dim() const {
  return uint32_t(size.size());
}

tensor4d_t::index_vec_type tensor4d_t::get_stride() const {
  return stride;
}

tensor4d_t &tensor4d_t::set_data_type(data_type_t data_type_) {
  if (is_valid()) {
    EXCEPTION_WITH_LOC("attempt to retype created tensor < " + name + " >.");
  }
  data_type = data_type_;
  return *this;
}

data_type_t tensor4d_t::get_data_type() const {
  return data_type;
}

tensor4d_t &tensor4d_t::set_name(std::string name_) {
  name = std::move(name_);
  return *this;
}

std::string tensor4d_t::get_name() const {
  return name;
}

tensor4d_t &tensor4d_t::set_storage(void *raw_ptr_, uint64_t sz_bytes_) {
  if (is_valid()) {
    EXCEPTION_WITH_LOC("attempt to rebind storage of tensor < " + name + " >.");
  }
  borrowed_ptr = raw_ptr_;
  borrowed_sz  = sz_bytes_;
  return *this;
}

uint64_t tensor4d_t::get_nelem() const {
  return nelem;
}

uint64_t tensor4d_t::get_buffer_sz_bytes() const {
  return nelem * size_of(data_type);
}

void *tensor4d_t::get_raw_handle_unsafe() const {
  return storage.get();
}

const void *tensor4d_t::get_raw_handle_const() const {
  return storage.get();
}

uint64_t tensor4d_t::compute_offset(const index_vec_type &index_) const {
  uint64_t offset = 0;
  for (std::size_t i = 0; i < index_.size(); ++i) {
    offset += stride[i]*index_[i];
  }
  return offset;
}

float tensor4d_t::at(const index_vec_type &index_) const {
  if (index_sanity_check(index_) != status_t::success) {
    EXCEPTION_WITH_LOC("bad index accessing tensor < " + name + " >.");
  }

  auto offset = compute_offset(index_);
  switch (data_type) {
  case data_type_t::f32 :
    return static_cast<const float *>(storage.get())[offset];
  case data_type_t::bf16 :
    return float(static_cast<const bfloat16_t *>(storage.get())[offset]);
  case data_type_t::s32 :
    return float(static_cast<const int32_t *>(storage.get())[offset]);
  }

  return 0.0f;
}

void tensor4d_t::set_at(const index_vec_type &index_, float value_) {
  if (index_sanity_check(index_) != status_t::success) {
    EXCEPTION_WITH_LOC("bad index accessing tensor < " + name + " >.");
  }

  auto offset = compute_offset(index_);
  switch (data_type) {
  case data_type_t::f32 :
    static_cast<float *>(storage.get())[offset] = value_;
    break;
  case data_type_t::bf16 :
    static_cast<bfloat16_t *>(storage.get())[offset] = bfloat16_t(value_);
    break;
  case data_type_t::s32 :
    static_cast<int32_t *>(storage.get())[offset] = int32_t(value_);
    break;
  }
}

tensor4d_t &tensor4d_t::create() {
  LOG_DEBUG_INFO("Creating tensor object ", name);

  //if already formed object, return the object
  if (status == status_t::success) {
    return (*this);
  }

  status = size_sanity_check();
  if (status != status_t::success) {
    log_error("tensor < ", name, " >: bad size");
    return (*this);
  }

  //row-major strides, every product must stay addressable with int64 offsets
  constexpr uint64_t max_bytes = uint64_t(std::numeric_limits<int64_t>::max());
  stride.assign(size.size(), 1);
  uint64_t count = 1;
  for (int64_t i = int64_t(size.size()) - 1; i >= 0; --i) {
    stride[i] = count;
    if (size[i] != 0 && count > max_bytes / size[i]) {
      log_error("tensor < ", name, " >: element count overflows");
      status = status_t::memory_bad_size;
      return (*this);
    }
    count *= size[i];
  }
  nelem = count;

  if (nelem > max_bytes / size_of(data_type)) {
    log_error("tensor < ", name, " >: byte size overflows");
    status = status_t::memory_bad_size;
    return (*this);
  }

  uint64_t buffer_size = get_buffer_sz_bytes();
  if (borrowed_ptr) {
    if (borrowed_sz < buffer_size) {
      log_error("tensor < ", name, " >: borrowed buffer of ", borrowed_sz,
                " bytes, need ", buffer_size);
      status = status_t::memory_bad_size;
      return (*this);
    }
    //borrowed storage is not freed
    storage = std::shared_ptr<void>(borrowed_ptr, [](void *) {});
  }
  else if (buffer_size) {
    uint64_t aligned_size = ((buffer_size + storage_alignment - 1)
                             / storage_alignment) * storage_alignment;
    void *raw = std::aligned_alloc(storage_alignment, aligned_size);
    if (raw == nullptr) {
      EXCEPTION_WITH_LOC("unable to allocate storage for tensor < " + name + " >.");
    }
    std::memset(raw, 0, aligned_size);
    storage = std::shared_ptr<void>(raw, [](void *p) {
      std::free(p);
    });
  }

  status = status_t::success;
  return (*this);
}

void tensor4d_t::reset() {
  size.clear();
  stride.clear();
  nelem        = 0;
  storage.reset();
  borrowed_ptr = nullptr;
  borrowed_sz  = 0;
  status       = status_t::failure;
}

status_t tensor4d_t::get_last_status() const {
  return status;
}

bool tensor4d_t::is_valid() const {
  return status == status_t::success;
}

bool tensor4d_t::is_alike(const tensor4d_t &other_) const {
  return (size == other_.size) && (data_type == other_.data_type);
}

std::string tensor4d_t::tensor_info() const {
  std::ostringstream ss;
  ss << name << "[";
  for (std::size_t i = 0; i < size.size(); ++i) {
    ss << (i ? "x" : "") << size[i];
  }
  ss << "]:" << dtype_info(data_type);
  return ss.str();
}

status_t tensor4d_t::size_sanity_check() const {
  if (size.empty()) {
    return status_t::memory_bad_size;
  }
  return status_t::success;
}

status_t tensor4d_t::index_sanity_check(const index_vec_type &index_) const {
  if (!is_valid() || index_.size() != size.size()) {
    return status_t::memory_bad_index;
  }
  for (std::size_t i = 0; i < index_.size(); ++i) {
    if (index_[i] >= size[i]) {
      return status_t::memory_bad_index;
    }
  }
  return status_t::success;
}

} //memory
} //winpool
