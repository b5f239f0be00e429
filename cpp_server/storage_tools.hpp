#ifndef STORAGE_TOOLS_HPP
#define STORAGE_TOOLS_HPP

#include "config.hpp"
#include "object_store.hpp"
#include "tool_registry.hpp"
#include "transfer_engine.hpp"

// Declares list_buckets, list_objects, get_object_metadata, download_object,
// read_object and get_presigned_url. get_presigned_url is only declared when
// `presigner` is non-null. All references must outlive the registry.
void RegisterStorageTools(ToolRegistry& registry, ObjectStore& store, TransferEngine& engine,
                          const UrlPresigner* presigner, const Config::ServerConfig& config);

#endif // STORAGE_TOOLS_HPP
