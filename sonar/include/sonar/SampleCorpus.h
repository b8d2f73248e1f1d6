#pragma once
#include "Common.h"

namespace sonar {

// Built-in historical analogs used when no persistence layer supplies a corpus.
Corpus sample_corpus();

} // namespace sonar
