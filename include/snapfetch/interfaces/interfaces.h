/**
 * @file interfaces.h
 * @brief Master include for all SnapFetch interfaces
 *
 * Include this single header to get all interface definitions.
 */

#pragma once

#include "i_clock.h"
#include "i_cache_store.h"
#include "i_data_fetcher.h"
#include "i_durable_store.h"
#include "i_task_executor.h"
