#pragma once

#include <cstddef>
#include <memory>
#include <optional>

namespace ffweave {

class Node;
class Stream;

/**
 * @brief Bind `source` to an input slot of `dest`.
 *
 * Without an explicit slot the first free slot is used.
 * @throws ConnectionError when the stream is already consumed (see Stream),
 *         the slot is taken or out of range, kinds differ, or no slot is left.
 */
void connect(Stream& source, const std::shared_ptr<Node>& dest,
             std::optional<std::size_t> slot = std::nullopt);

/**
 * @brief Bind `source` to the first free slot of `dest` accepting its kind.
 * @return the slot that was used.
 * @throws NoFreeSlotError when no such slot exists.
 */
std::size_t pipe(Stream& source, const std::shared_ptr<Node>& dest);

} // namespace ffweave
