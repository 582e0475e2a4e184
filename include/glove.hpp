#pragma once

#include "errors.hpp"
#include "dense_matrix.hpp"
#include "sparse_matrix.hpp"
#include "thread_pool.hpp"
#include "vocabulary.hpp"
#include "corpus.hpp"
#include "cooccurrence.hpp"
#include "vector_space.hpp"
#include "trainer.hpp"
#include "query.hpp"
#include "model.hpp"
