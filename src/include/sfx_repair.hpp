#pragma once
/**
 * @file sfx_repair.hpp
 * @brief Layer 3: Scene-document repair built on sfx_service.
 *
 * Provides the scene data model, the YAML DocumentStore, BackupManager, the pure
 * Detector and Repairer, findings reporting, the transactional RepairPipeline, and the
 * JSON service configuration.
 */
#include "sfx_service.hpp"

#include "repair/backup_manager.hpp"
#include "repair/detector.hpp"
#include "repair/document_store.hpp"
#include "repair/findings_report.hpp"
#include "repair/repair_error.hpp"
#include "repair/repair_pipeline.hpp"
#include "repair/repair_service_config.hpp"
#include "repair/repairer.hpp"
#include "repair/scene_document.hpp"
