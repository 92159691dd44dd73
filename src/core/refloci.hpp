#ifndef REFLOCI_MODULE_H
#define REFLOCI_MODULE_H

/**
 * Persistent, indexed collections of reference loci and related terms.
 */
#include "refloci/RefLoci.hpp"
#include "refloci/Term.hpp"

#endif // REFLOCI_MODULE_H
