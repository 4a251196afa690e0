#pragma once

// Umbrella header for the panedock library.

#include <panedock/dock_config.hpp>
#include <panedock/dock_manager.hpp>
#include <panedock/dock_types.hpp>
#include <panedock/drag_controller.hpp>
#include <panedock/drop_zone.hpp>
#include <panedock/fwd.hpp>
#include <panedock/geometry.hpp>
#include <panedock/layout_serializer.hpp>
#include <panedock/layout_state.hpp>
#include <panedock/layout_tree.hpp>
#include <panedock/logger.hpp>
#include <panedock/pane_id_generator.hpp>
#include <panedock/pane_registry.hpp>
