/**
 * @file istoragegateway.cpp
 * @brief Implementation file for IStorageGateway interface.
 *
 * This file exists to support Qt's MOC (Meta-Object Compiler) which requires
 * a .cpp file to generate the meta-object for the interface.
 */

#include "istoragegateway.h"

// Qt MOC requires this file to exist for proper meta-object generation
// The interface itself is pure virtual
