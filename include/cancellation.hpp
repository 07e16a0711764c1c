//
//  cancellation.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <memory>

namespace subforge {

// Request-scoped cancel flag shared between the hosting layer (connection dropped,
// client went away) and the code doing the work. Copies share the same flag.
class CancellationToken {
   public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

   private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace subforge
