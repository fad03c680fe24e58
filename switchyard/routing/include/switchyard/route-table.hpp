#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "switchyard/flat-hash-map.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

// Immutable collection of route entries partitioned in buckets keyed by (method, number of segments).
//
// Matching an inbound path only scans the bucket of its method and number of components, in registration
// order; the first entry whose segments all match wins. There is no specificity ranking: an earlier
// registered wildcard pattern hides a later literal pattern of the same shape.
//
// A RouteTable is never modified after construction, so it can be read from any number of threads
// without synchronization.
class RouteTable {
 public:
  struct BucketKey {
    bool operator==(const BucketKey&) const noexcept = default;

    http::Method method;
    uint32_t nbSegments;
  };

  struct BucketKeyHash {
    std::size_t operator()(BucketKey key) const noexcept {
      return (static_cast<std::size_t>(key.nbSegments) << 16) | static_cast<std::size_t>(key.method);
    }
  };

  using Bucket = vector<RouteEntry>;

  // Creates an empty table, matching nothing.
  RouteTable() = default;

  // Distributes the entries in their buckets, keeping their relative order within each bucket.
  explicit RouteTable(vector<RouteEntry> entries);

  // Find the first entry matching given method and path.
  // On success, returns the entry and appends the wildcard values to 'captures', in left-to-right order.
  // Returns nullptr if no entry matches.
  const RouteEntry* find(http::Method method, std::string_view path, PathParams& captures) const;

  // Return a bitmap of the methods having at least one entry matching 'path'.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  // The ordered entries sharing given method and number of segments (empty if none).
  [[nodiscard]] std::span<const RouteEntry> bucket(http::Method method, std::size_t nbSegments) const noexcept;

  // Total number of entries.
  [[nodiscard]] std::size_t size() const noexcept { return _nbEntries; }

  [[nodiscard]] bool empty() const noexcept { return _nbEntries == 0; }

  [[nodiscard]] std::size_t bucketCount() const noexcept { return _buckets.size(); }

 private:
  using BucketMap = flat_hash_map<BucketKey, Bucket, BucketKeyHash>;

  BucketMap _buckets;
  std::size_t _nbEntries{};
};

}  // namespace switchyard
