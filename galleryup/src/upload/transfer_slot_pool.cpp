//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "upload/transfer_slot_pool.hpp"

#include <stdexcept>

namespace galleryup {
TransferSlotPool::Lease::Lease(TransferSlotPool* pool, slot_id_t slot) : pool_(pool), slot_(slot) {}

TransferSlotPool::Lease::Lease(Lease&& other) noexcept : pool_(other.pool_), slot_(other.slot_) {
  other.pool_ = nullptr;
}

TransferSlotPool::Lease::~Lease() {
  if (pool_) pool_->Release(slot_);
}

auto TransferSlotPool::Lease::Handle() -> TransferHandle& { return *pool_->handles_[slot_]; }

TransferSlotPool::TransferSlotPool(size_t slot_count, const TransferHandleFactory& factory) {
  if (slot_count == 0) {
    throw std::invalid_argument("TransferSlotPool: slot count must be positive");
  }
  handles_.reserve(slot_count);
  for (size_t i = 0; i < slot_count; ++i) {
    handles_.push_back(factory());
    // Handed out from the back, so slot 0 goes first
    free_slots_.push_back(slot_count - 1 - i);
  }
}

auto TransferSlotPool::Acquire() -> Lease {
  std::unique_lock<std::mutex> lock(mtx_);
  slot_freed_.wait(lock, [this] { return !free_slots_.empty(); });
  slot_id_t slot = free_slots_.back();
  free_slots_.pop_back();
  return Lease(this, slot);
}

void TransferSlotPool::Release(slot_id_t slot) {
  handles_[slot]->Reset();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    free_slots_.push_back(slot);
  }
  slot_freed_.notify_all();
}

void TransferSlotPool::BeginGallery() {
  std::unique_lock<std::mutex> lock(mtx_);
  slot_freed_.wait(lock, [this] { return free_slots_.size() == handles_.size(); });
  for (auto& handle : handles_) handle->ClearSession();
}

auto TransferSlotPool::FreeCount() -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return free_slots_.size();
}
};  // namespace galleryup
