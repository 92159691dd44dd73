#ifndef LOCIO_H
#define LOCIO_H

/**
 * Genomic coordinates, interval algebra and range indexing.
 */
#include "locio/types.hpp"
#include "locio/exceptions.hpp"
#include "locio/Interval.hpp"
#include "locio/Locus.hpp"
#include "locio/LocusIndex.hpp"

#endif // LOCIO_H
