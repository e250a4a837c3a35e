#include "bolt/path-matcher.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "bolt/handler.hpp"
#include "bolt/http-method.hpp"
#include "bolt/log.hpp"
#include "bolt/path-params.hpp"
#include "bolt/vector.hpp"

namespace bolt {
namespace {

constexpr std::string_view kUnnamedWildcard = "*";

struct CompiledSegment {
  enum class Type : uint8_t { Literal, Param, Wildcard };

  Type type;
  std::string_view text;  // literal text or capture name
};

// Splits 'pattern' into typed segments. "/" gives no segment, a trailing slash gives a final empty literal.
vector<CompiledSegment> CompilePattern(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument(std::format("Route pattern '{}' must begin with '/'", pattern));
  }

  vector<CompiledSegment> segments;
  if (pattern.size() == 1U) {
    return segments;
  }

  for (std::size_t pos = 1U;;) {
    const std::size_t nextSlash = pattern.find('/', pos);
    const bool isLast = nextSlash == std::string_view::npos;
    const std::string_view segment = isLast ? pattern.substr(pos) : pattern.substr(pos, nextSlash - pos);

    if (!segments.empty() && segments.back().type == CompiledSegment::Type::Wildcard) {
      throw std::invalid_argument(std::format("Wildcard must be the last segment of route pattern '{}'", pattern));
    }

    if (segment.empty()) {
      if (!isLast) {
        throw std::invalid_argument(std::format("Route pattern '{}' contains an empty segment", pattern));
      }
      segments.push_back(CompiledSegment{CompiledSegment::Type::Literal, segment});
    } else if (segment.front() == ':') {
      if (segment.size() == 1U) {
        throw std::invalid_argument(std::format("Empty parameter name in route pattern '{}'", pattern));
      }
      segments.push_back(CompiledSegment{CompiledSegment::Type::Param, segment.substr(1U)});
    } else if (segment.front() == '*') {
      segments.push_back(CompiledSegment{CompiledSegment::Type::Wildcard,
                                         segment.size() == 1U ? kUnnamedWildcard : segment.substr(1U)});
    } else {
      segments.push_back(CompiledSegment{CompiledSegment::Type::Literal, segment});
    }

    if (isLast) {
      break;
    }
    pos = nextSlash + 1U;
  }
  return segments;
}

}  // namespace

PathMatcher::PathMatcher(uint32_t maxParams) : _maxParams(maxParams) {}

PathMatcher::~PathMatcher() = default;

PathMatcher::RouteNode* PathMatcher::newNode(std::string_view segment) {
  auto& pNode = _nodes.emplace_back(std::make_unique<RouteNode>());
  pNode->segment.assign(segment);
  return pNode.get();
}

PathMatcher::RouteNode* PathMatcher::ensureLiteralChild(RouteNode& node, std::string_view literal) {
  const auto it = node.literalChildren.find(literal);
  if (it != node.literalChildren.end()) {
    return it->second;
  }
  RouteNode* pChild = newNode(literal);
  node.literalChildren.emplace(std::string_view(pChild->segment), pChild);
  return pChild;
}

PathMatcher::RouteNode* PathMatcher::ensureParamChild(RouteNode& node, std::string_view name) {
  if (node.paramChild == nullptr) {
    node.paramChild = newNode(name);
  }
  return node.paramChild;
}

PathMatcher::RouteNode* PathMatcher::ensureWildcardChild(RouteNode& node, std::string_view name) {
  if (node.wildcardChild == nullptr) {
    node.wildcardChild = newNode(name);
  }
  return node.wildcardChild;
}

void PathMatcher::add(http::Method method, std::string_view pattern, HandlerChain chain) {
  if (chain.empty()) {
    throw std::invalid_argument(std::format("Cannot register an empty handler chain for '{}'", pattern));
  }
  for (const Handler& handler : chain) {
    if (!handler) {
      throw std::invalid_argument(std::format("Cannot register an empty handler for '{}'", pattern));
    }
  }

  const auto segments = CompilePattern(pattern);

  std::size_t nbCaptures = 0;
  for (const CompiledSegment& segment : segments) {
    nbCaptures += segment.type == CompiledSegment::Type::Literal ? 0U : 1U;
  }
  if (nbCaptures > _maxParams) {
    throw std::invalid_argument(
        std::format("Route pattern '{}' has {} captures, maximum is {}", pattern, nbCaptures, _maxParams));
  }

  // Validate names along the existing trie before creating anything, so that a rejected pattern leaves no node.
  if (_pRoot != nullptr) {
    const RouteNode* pNode = _pRoot;
    for (const CompiledSegment& segment : segments) {
      switch (segment.type) {
        case CompiledSegment::Type::Literal: {
          const auto it = pNode->literalChildren.find(segment.text);
          pNode = it == pNode->literalChildren.end() ? nullptr : it->second;
          break;
        }
        case CompiledSegment::Type::Param:
          pNode = pNode->paramChild;
          if (pNode != nullptr && pNode->segment != segment.text) {
            throw std::logic_error(std::format("Conflicting parameter names ':{}' and ':{}' in route '{}'",
                                               pNode->segment, segment.text, pattern));
          }
          break;
        case CompiledSegment::Type::Wildcard:
          pNode = pNode->wildcardChild;
          if (pNode != nullptr && pNode->segment != segment.text) {
            throw std::logic_error(std::format("Conflicting wildcard names '{}' and '{}' in route '{}'",
                                               pNode->segment, segment.text, pattern));
          }
          break;
      }
      if (pNode == nullptr) {
        break;
      }
    }
  } else {
    _pRoot = newNode({});
  }

  RouteNode* pNode = _pRoot;
  for (const CompiledSegment& segment : segments) {
    switch (segment.type) {
      case CompiledSegment::Type::Literal:
        pNode = ensureLiteralChild(*pNode, segment.text);
        break;
      case CompiledSegment::Type::Param:
        pNode = ensureParamChild(*pNode, segment.text);
        break;
      case CompiledSegment::Type::Wildcard:
        pNode = ensureWildcardChild(*pNode, segment.text);
        break;
    }
  }

  const auto methodIdx = http::MethodToIdx(method);
  if (http::IsMethodSet(pNode->methodBmp, method)) {
    log::warn("Overwriting existing {} handler chain for {}", http::MethodToStr(method), pattern);
  } else {
    pNode->methodBmp = static_cast<http::MethodBmp>(pNode->methodBmp | static_cast<http::MethodBmp>(method));
    ++_nbRoutes;
  }
  pNode->handlersByMethod[methodIdx] = std::move(chain);

  log::debug("Registered {} {} with {} handler(s)", http::MethodToStr(method), pattern,
             pNode->handlersByMethod[methodIdx].size());
}

void PathMatcher::add(std::string_view method, std::string_view pattern, HandlerChain chain) {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    throw std::invalid_argument(std::format("Unknown HTTP method '{}' for route '{}'", method, pattern));
  }
  add(*optMethod, pattern, std::move(chain));
}

const PathMatcher::RouteNode* PathMatcher::resolve(std::string_view path, Params* pParams) const {
  if (_pRoot == nullptr || path.empty() || path.front() != '/') {
    return nullptr;
  }

  const RouteNode* pNode = _pRoot;
  if (path.size() == 1U) {
    return pNode;
  }

  for (std::size_t pos = 1U;;) {
    const std::size_t nextSlash = path.find('/', pos);
    const bool isLast = nextSlash == std::string_view::npos;
    const std::string_view segment = isLast ? path.substr(pos) : path.substr(pos, nextSlash - pos);

    if (const auto it = pNode->literalChildren.find(segment); it != pNode->literalChildren.end()) {
      pNode = it->second;
    } else if (pNode->paramChild != nullptr && !segment.empty()) {
      pNode = pNode->paramChild;
      if (pParams != nullptr) {
        pParams->push_back(pNode->segment, segment);
      }
    } else if (pNode->wildcardChild != nullptr) {
      pNode = pNode->wildcardChild;
      if (pParams != nullptr) {
        pParams->push_back(pNode->segment, path.substr(pos));
      }
      return pNode;
    } else {
      return nullptr;
    }

    if (isLast) {
      break;
    }
    pos = nextSlash + 1U;
  }
  return pNode;
}

http::MethodBmp PathMatcher::ReachableMethods(const RouteNode& node) noexcept {
  if (node.wildcardChild == nullptr) {
    return node.methodBmp;
  }
  return static_cast<http::MethodBmp>(node.methodBmp | node.wildcardChild->methodBmp);
}

PathMatcher::Result PathMatcher::find(http::Method method, std::string_view path, Params& params) const {
  if (params.maxSize() < _maxParams) {
    params = Params(_maxParams);
  } else {
    params.clear();
  }

  const RouteNode* pNode = resolve(path, &params);
  if (pNode == nullptr) {
    params.clear();
    return {Status::NotFound, nullptr};
  }
  if (!http::IsMethodSet(pNode->methodBmp, method) && pNode->wildcardChild != nullptr &&
      http::IsMethodSet(pNode->wildcardChild->methodBmp, method)) {
    pNode = pNode->wildcardChild;
    params.push_back(pNode->segment, std::string_view{});
  }
  if (!http::IsMethodSet(pNode->methodBmp, method)) {
    const bool hasRoute = ReachableMethods(*pNode) != 0;
    params.clear();
    return {hasRoute ? Status::NotAllowed : Status::NotFound, nullptr};
  }
  return {Status::Matched, &pNode->handlersByMethod[http::MethodToIdx(method)]};
}

PathMatcher::Result PathMatcher::find(std::string_view method, std::string_view path, Params& params) const {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (optMethod) {
    return find(*optMethod, path, params);
  }
  params.clear();
  const RouteNode* pNode = resolve(path, nullptr);
  if (pNode == nullptr || ReachableMethods(*pNode) == 0) {
    return {Status::NotFound, nullptr};
  }
  return {Status::NotAllowed, nullptr};
}

http::MethodBmp PathMatcher::allowedMethods(std::string_view path) const {
  const RouteNode* pNode = resolve(path, nullptr);
  return pNode == nullptr ? http::MethodBmp{0} : ReachableMethods(*pNode);
}

void PathMatcher::clear() noexcept {
  _nodes.clear();
  _pRoot = nullptr;
  _nbRoutes = 0;
}

}  // namespace bolt
