/*
 * Copyright (c) 2024 Aurora Poller Project
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
 */

// Primary include guard
#ifndef AURORA_UTILS__SERIAL__SERIAL_BACKEND_HPP_
#define AURORA_UTILS__SERIAL__SERIAL_BACKEND_HPP_

#pragma once

#include <algorithm>

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace aurora
{
namespace serial
{

struct SerialOptions
{
  // Serial device path, or host:port for the TCP bridge
  std::string device;
  int baud_rate = 19200;
  int read_timeout_ms = 100;
  int write_timeout_ms = 100;
};

class SerialBackend
{
public:
  virtual ~SerialBackend() = default;

  virtual bool open(const SerialOptions & opts) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Returns bytes read; 0 on timeout; negative on error
  virtual int read(uint8_t * buf, size_t len) = 0;
  // Returns bytes written; negative on error
  virtual int write(const uint8_t * buf, size_t len) = 0;

  // Short identifier for logs
  virtual std::string describe() const = 0;
};

// In-memory stream for tests: bytes written are captured, bytes to be read
// are queued with feed()
class BufferedBackend : public SerialBackend
{
public:
  BufferedBackend() = default;
  bool open(const SerialOptions & opts) override {opts_ = opts; open_ = true; return true;}
  void close() override {open_ = false; rx_.clear();}
  bool is_open() const override {return open_;}

  int read(uint8_t * buf, size_t len) override
  {
    if (!open_ || fail_reads_) {return -1;}
    size_t n = rx_.size();
    if (n == 0) {
      return 0;            // timeout behavior for stub
    }
    size_t to_copy = (len < n) ? len : n;
    std::copy(rx_.begin(), rx_.begin() + to_copy, buf);
    rx_.erase(rx_.begin(), rx_.begin() + to_copy);
    return static_cast<int>(to_copy);
  }

  int write(const uint8_t * buf, size_t len) override
  {
    if (!open_ || fail_writes_) {return -1;}
    tx_.insert(tx_.end(), buf, buf + len);
    return static_cast<int>(len);
  }

  std::string describe() const override {return "buffered";}

  void feed(const std::vector<uint8_t> & bytes) {rx_.insert(rx_.end(), bytes.begin(), bytes.end());}
  const std::vector<uint8_t> & written() const {return tx_;}
  void clearWritten() {tx_.clear();}
  void failReads(bool fail) {fail_reads_ = fail;}
  void failWrites(bool fail) {fail_writes_ = fail;}

private:
  SerialOptions opts_{};
  bool open_ = false;
  bool fail_reads_ = false;
  bool fail_writes_ = false;
  std::vector<uint8_t> rx_;
  std::vector<uint8_t> tx_;
};

} // namespace serial
} // namespace aurora

#endif  // AURORA_UTILS__SERIAL__SERIAL_BACKEND_HPP_
