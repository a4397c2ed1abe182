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


#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "type/type.hpp"
#include "upload/transfer_handle.hpp"

namespace galleryup {
/**
 * @brief One transfer handle per worker slot. A slot is leased for exactly one upload and
 *        reset, not destroyed, when the lease ends. Handles are never shared between leases.
 */
class TransferSlotPool {
 public:
  class Lease {
   public:
    Lease(TransferSlotPool* pool, slot_id_t slot);
    Lease(Lease&& other) noexcept;
    Lease(const Lease&)            = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&)      = delete;
    ~Lease();

    auto Handle() -> TransferHandle&;
    auto Slot() const -> slot_id_t { return slot_; }

   private:
    TransferSlotPool* pool_;
    slot_id_t         slot_;
  };

  TransferSlotPool(size_t slot_count, const TransferHandleFactory& factory);

  /**
   * @brief Block until a slot is free and lease it.
   */
  auto Acquire() -> Lease;

  /**
   * @brief Clear the session state of every handle. Called once per gallery, while no slot is
   *        leased.
   */
  void BeginGallery();

  auto Size() const -> size_t { return handles_.size(); }
  auto FreeCount() -> size_t;

 private:
  void                                         Release(slot_id_t slot);

  std::vector<std::unique_ptr<TransferHandle>> handles_;
  std::vector<slot_id_t>                       free_slots_;
  std::mutex                                   mtx_;
  std::condition_variable                      slot_freed_;
};
};  // namespace galleryup
