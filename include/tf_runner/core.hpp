// tf_runner/core.hpp
// Umbrella header for the tf_runner model execution library
//
// Pulls in the engine wrappers, the ModelRunner lifecycle and the
// ImageClassifier built on top of it.

#pragma once

#include "tf_runner/scope_guard.hpp"   // RAII scope-exit cleanup (used internally)
#include "tf_runner/error.hpp"         // Structured exception type (tf_runner::Error)
#include "tf_runner/logging.hpp"       // spdlog logger shared by the library
#include "tf_runner/status.hpp"
#include "tf_runner/tensor.hpp"
#include "tf_runner/graph.hpp"
#include "tf_runner/session.hpp"
#include "tf_runner/ops.hpp"
#include "tf_runner/model_asset.hpp"
#include "tf_runner/backend.hpp"
#include "tf_runner/channel_order.hpp"
#include "tf_runner/runtime_graph.hpp"
#include "tf_runner/model_runner.hpp"
#include "tf_runner/graph_augmentation.hpp"
#include "tf_runner/labels.hpp"
#include "tf_runner/image.hpp"
#include "tf_runner/texture.hpp"
#include "tf_runner/frame_scheduler.hpp"
#include "tf_runner/readback.hpp"
#include "tf_runner/config.hpp"
#include "tf_runner/image_classifier.hpp"

// ============================================================================
// tf_runner - Quick Reference
// ============================================================================
//
// ENGINE WRAPPERS:
// ─────────────────────────────────────────────────────────────────────────────
//   tf_runner::Tensor         - RAII wrapper for TF_Tensor
//   tf_runner::Graph          - RAII wrapper for TF_Graph (frozen once a Session exists)
//   tf_runner::Session        - RAII wrapper for TF_Session
//   tf_runner::SessionOptions - RAII wrapper for TF_SessionOptions
//   tf_runner::Feed / Fetch   - Run() inputs and outputs
//
// MODEL LIFECYCLE:
// ─────────────────────────────────────────────────────────────────────────────
//   tf_runner::ModelAsset           - Serialized GraphDef plus declared endpoints
//   tf_runner::RuntimeGraph         - Imported graph placed on the backend device
//   tf_runner::ModelRunner          - configure -> prepare -> initialize -> execute
//   tf_runner::RunnerHooks          - backend validation and graph augmentation
//   tf_runner::OutputTensor         - Output handle valid for one execute cycle
//   tf_runner::ChannelOrderRegistry - Process-wide channel layout lease
//
// CLASSIFICATION:
// ─────────────────────────────────────────────────────────────────────────────
//   tf_runner::ImageClassifier   - Scores in label order (sync or async readback)
//   tf_runner::LabelTable        - {"classes": [...]} label asset
//   tf_runner::ClassifierConfig  - JSON configuration
//   tf_runner::ReadbackTransport - Device-to-host copy with typed outcome
//
// THREAD SAFETY:
// ─────────────────────────────────────────────────────────────────────────────
//   ModelRunner and ImageClassifier are single-threaded and not reentrant
//   Readback completions run on the FrameScheduler thread (tick())
//   ChannelOrderRegistry is mutex-protected
//
// USAGE:
// ─────────────────────────────────────────────────────────────────────────────
//   auto config = tf_runner::ClassifierConfig::Load("classifier.json");
//   auto asset  = tf_runner::ModelAsset::Load(config.model_path);
//   auto labels = tf_runner::detail::read_file_text(config.labels_path, "labels");
//
//   tf_runner::ImageClassifier classifier(config);
//   if (!classifier.start(asset, labels)) { /* degraded: model did not load */ }
//
//   auto scores = classifier.classify(tf_runner::Image::Zeros(224, 224));
//   for (std::size_t i = 0; i < scores.size(); ++i) {
//       std::cout << classifier.class_name(static_cast<int>(i)) << " " << scores[i] << "\n";
//   }
//
// LOGGING:
// ─────────────────────────────────────────────────────────────────────────────
//   tf_runner::logger()               - spdlog logger named "tf_runner"
//   tf_runner::set_logger(my_logger)  - redirect library logging
//
