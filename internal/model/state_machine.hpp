#pragma once

#include "longform/editor/v1.hpp"

namespace longform::model {

using RenderStatus = longform::editor::v1::RenderStatus;

/*
  Render lifecycle: QUEUED -> RENDERING -> COMPLETED | FAILED.

  Terminal states never change again. Observed provider states may skip
  RENDERING but never move a render backwards.
*/

constexpr int Rank(RenderStatus status) {
  switch (status) {
    case longform::editor::v1::RENDER_STATUS_QUEUED:
      return 1;
    case longform::editor::v1::RENDER_STATUS_RENDERING:
      return 2;
    case longform::editor::v1::RENDER_STATUS_COMPLETED:
    case longform::editor::v1::RENDER_STATUS_FAILED:
      return 3;
    default:
      return 0;
  }
}

constexpr bool IsTerminal(RenderStatus status) {
  return status == longform::editor::v1::RENDER_STATUS_COMPLETED || status == longform::editor::v1::RENDER_STATUS_FAILED;
}

constexpr bool CanTransition(RenderStatus from, RenderStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (Rank(to) == 0) {
    return false;
  }

  return Rank(to) > Rank(from);
}

} // namespace longform::model
