/**
 * @file DexView.hpp
 * @brief A convenience header to include the whole public API.
 */

#pragma once

#include "Exceptions.hpp"
#include "AccessFlags.hpp"
#include "DexFile.hpp"
#include "DexReader.hpp"
#include "FixedStrideList.hpp"
#include "EncodedValue.hpp"
#include "StaticValueIterator.hpp"
#include "Annotation.hpp"
#include "AnnotationsDirectory.hpp"
#include "Field.hpp"
#include "Method.hpp"
#include "MemberList.hpp"
#include "ClassDef.hpp"
