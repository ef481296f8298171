// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "staffing/base/threadpool.h"

#include <functional>
#include <mutex>  // NOLINT
#include <thread>  // NOLINT
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"

namespace staffing {

ThreadPool::ThreadPool(absl::string_view prefix, int num_threads)
    : name_(prefix), num_workers_(num_threads) {
  CHECK_GT(num_threads, 0);
}

ThreadPool::~ThreadPool() {
  if (started_) {
    std::unique_lock<std::mutex> mutex_lock(mutex_);
    waiting_to_finish_ = true;
    mutex_lock.unlock();
    condition_.notify_all();
    for (std::thread& worker : all_workers_) {
      worker.join();
    }
  }
}

void ThreadPool::StartWorkers() {
  CHECK(!started_);
  started_ = true;
  VLOG(1) << "Starting " << num_workers_ << " worker(s) in pool " << name_;
  for (int i = 0; i < num_workers_; ++i) {
    all_workers_.push_back(std::thread(&ThreadPool::RunWorker, this));
  }
}

void ThreadPool::RunWorker() {
  std::function<void()> work = GetNextTask();
  while (work != nullptr) {
    work();
    work = GetNextTask();
  }
}

std::function<void()> ThreadPool::GetNextTask() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (!tasks_.empty()) {
      std::function<void()> task = std::move(tasks_.front());
      tasks_.pop_front();
      return task;
    }
    if (waiting_to_finish_) {
      return nullptr;
    }
    condition_.wait(lock);
  }
}

void ThreadPool::Schedule(std::function<void()> closure) {
  std::unique_lock<std::mutex> lock(mutex_);
  tasks_.push_back(std::move(closure));
  if (started_) {
    lock.unlock();
    condition_.notify_all();
  }
}

}  // namespace staffing
