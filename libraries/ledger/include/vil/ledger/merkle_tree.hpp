#pragma once

#include <vil/ledger/types.hpp>

namespace vil { namespace ledger {

/**
 *  @class merkle_tree
 *  @brief in-memory append-only Merkle tree over leaf hashes
 *
 *  Nodes are paired left to right at every level.  When a level has an odd
 *  number of nodes the last one is promoted to the next level unchanged.
 *  Appending only touches the path from the new leaf to the root, so an
 *  append costs O(log n) hashes.
 */
class merkle_tree
{
   public:
      static digest_type empty_root();

      /** H( left || right ), order is significant */
      static digest_type hash_pair( const digest_type& left, const digest_type& right );

      /**
       *  Recombines proof.leaf with every sibling on the side given by
       *  proof.positions and compares the result with proof.root.
       */
      static bool verify( const inclusion_proof& proof );

      uint32_t    size()const;
      bool        empty()const { return size() == 0; }
      digest_type root()const;

      const digest_type& leaf( uint32_t position )const;

      /**
       *  Node values on the path of a leaf appended next, from the leaf up
       *  to the root that the tree would have.  Does not modify the tree.
       */
      vector<digest_type> compute_path( const digest_type& leaf )const;

      /** @return the position of the new leaf */
      uint32_t append( const digest_type& leaf );

      inclusion_proof proof( uint32_t position )const;

      void clear();

   private:
      vector< vector<digest_type> > _levels;
};

} } // vil::ledger
