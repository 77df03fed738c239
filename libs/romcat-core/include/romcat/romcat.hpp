#pragma once

/**
@file
@brief The entrypoint of the romcat core library. Includes all functionality needed to build and query a catalog.
*/

#include <romcat/version.hpp>

#include <romcat/core/configuration.hpp>

#include <romcat/catalog/catalog_db.hpp>
#include <romcat/catalog/definitions.hpp>
#include <romcat/catalog/name_parser.hpp>

#include <romcat/db/hash_index.hpp>

#include <romcat/media/hasher.hpp>
#include <romcat/media/header_format.hpp>

#include <romcat/repair/repair_strategy.hpp>

#include <romcat/import/merge.hpp>
#include <romcat/import/overrides.hpp>
#include <romcat/import/reconcile.hpp>
#include <romcat/import/reference_import.hpp>
#include <romcat/import/scan.hpp>
