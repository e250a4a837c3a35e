#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "bolt/flat-hash-map.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-method.hpp"
#include "bolt/path-params.hpp"
#include "bolt/vector.hpp"

namespace bolt {

// Segment trie resolving a (method, path) pair to a handler chain.
//
// Pattern syntax, segments being separated by '/':
//  - literal text is matched verbatim,
//  - ':name' matches exactly one non-empty segment, captured under 'name',
//  - '*' or '*name' must be the last segment and matches the remainder of the path (slashes included, possibly
//    empty), captured under 'name' or "*" when unnamed.
// At each level a literal child is preferred over the parameter child, itself preferred over the wildcard child.
// Descent is greedy and never backtracks, so matching is linear in the number of path segments.
//
// Registration must be complete before concurrent calls to find(), which are then safe.
class PathMatcher {
 public:
  enum class Status : uint8_t { Matched, NotFound, NotAllowed };

  struct Result {
    Status status{Status::NotFound};
    const HandlerChain* pChain{nullptr};  // only set when Matched
  };

  // 'maxParams' is the maximum number of captures of a single pattern.
  explicit PathMatcher(uint32_t maxParams);

  PathMatcher(const PathMatcher&) = delete;
  PathMatcher(PathMatcher&&) noexcept = default;
  PathMatcher& operator=(const PathMatcher&) = delete;
  PathMatcher& operator=(PathMatcher&&) noexcept = default;

  ~PathMatcher();

  // Registers 'chain' for 'method' on 'pattern'. An existing chain for the same method and pattern is replaced.
  // Throws std::invalid_argument for malformed patterns, empty chains and patterns with more captures than
  // maxParams(), and std::logic_error if the pattern names a capture differently than an already registered one at
  // the same position.
  void add(http::Method method, std::string_view pattern, HandlerChain chain);

  // Same as above, with a method token parsed case-insensitively. Throws std::invalid_argument for unknown methods.
  void add(std::string_view method, std::string_view pattern, HandlerChain chain);

  // Resolves 'path' for 'method'. On Matched, 'params' holds the captures, whose values point into 'path' and keys
  // into this PathMatcher. 'params' is cleared otherwise, and grown to maxParams() captures if it is smaller.
  // A path ending on a node with a wildcard child matches that wildcard with an empty capture when the node itself
  // has no chain for 'method'.
  [[nodiscard]] Result find(http::Method method, std::string_view path, Params& params) const;

  // Unknown method tokens never match: they give NotAllowed on an existing route and NotFound otherwise.
  [[nodiscard]] Result find(std::string_view method, std::string_view path, Params& params) const;

  // Bitmap of the methods 'path' can match, 0 if none. This includes the methods of an empty-remainder wildcard.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  // Number of registered (method, pattern) pairs.
  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _nbRoutes; }

  [[nodiscard]] uint32_t maxParams() const noexcept { return _maxParams; }

  // Removes all routes.
  void clear() noexcept;

 private:
  struct RouteNode {
    // Keys point into the child's 'segment'.
    string_view_hash_map<RouteNode*> literalChildren;
    RouteNode* paramChild{nullptr};
    RouteNode* wildcardChild{nullptr};
    // Literal text for literal nodes, capture name for parameter and wildcard nodes.
    std::string segment;
    std::array<HandlerChain, http::kNbMethods> handlersByMethod;
    http::MethodBmp methodBmp{0};
  };

  RouteNode* newNode(std::string_view segment);

  RouteNode* ensureLiteralChild(RouteNode& node, std::string_view literal);
  RouteNode* ensureParamChild(RouteNode& node, std::string_view name);
  RouteNode* ensureWildcardChild(RouteNode& node, std::string_view name);

  // Returns the node 'path' resolves to, or nullptr. Captures are appended to 'pParams' when not null.
  // The empty-remainder wildcard of the returned node is not descended into.
  [[nodiscard]] const RouteNode* resolve(std::string_view path, Params* pParams) const;

  // Methods of 'node' and of its empty-remainder wildcard.
  [[nodiscard]] static http::MethodBmp ReachableMethods(const RouteNode& node) noexcept;

  vector<std::unique_ptr<RouteNode>> _nodes;
  RouteNode* _pRoot{nullptr};
  std::size_t _nbRoutes{0};
  uint32_t _maxParams;
};

}  // namespace bolt
