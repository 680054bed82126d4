#pragma once

#include "longform/editor/core/v1/recipe.pb.h"
#include "longform/editor/core/v1/render.pb.h"
#include "longform/editor/core/v1/timeline.pb.h"
#include "longform/editor/core/v1/transcript.pb.h"

#include "longform/editor/providers/v1/common.pb.h"
#include "longform/editor/providers/v1/render_provider.pb.h"
#include "longform/editor/providers/v1/transcription_provider.pb.h"

#include "longform/editor/services/v1/editing_service.pb.h"

#include "longform/editor/providers/v1/render_provider.grpc.pb.h"
#include "longform/editor/providers/v1/transcription_provider.grpc.pb.h"
#include "longform/editor/services/v1/editing_service.grpc.pb.h"

namespace longform::editor::v1 {
using namespace ::longform::editor::core::v1;
using namespace ::longform::editor::providers::v1;
using namespace ::longform::editor::services::v1;
}
