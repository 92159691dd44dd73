#ifndef STORAGE_H
#define STORAGE_H

/**
 * Durable blob storage used to persist frozen collections.
 */
#include "storage/BlobStore.hpp"
#include "storage/DirBlobStore.hpp"
#include "storage/MemBlobStore.hpp"

#endif // STORAGE_H
