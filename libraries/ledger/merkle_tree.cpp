#include <vil/ledger/merkle_tree.hpp>

#include <fc/exception/exception.hpp>

namespace vil { namespace ledger {

   digest_type merkle_tree::empty_root()
   {
      return fc::sha256::hash( std::string( VIL_EMPTY_ROOT_SEED ) );
   }

   digest_type merkle_tree::hash_pair( const digest_type& left, const digest_type& right )
   {
      const char prefix = char( VIL_NODE_HASH_PREFIX );
      fc::sha256::encoder enc;
      enc.write( &prefix, 1 );
      enc.write( left.data(), sizeof( left ) );
      enc.write( right.data(), sizeof( right ) );
      return enc.result();
   }

   bool merkle_tree::verify( const inclusion_proof& proof )
   {
      if( proof.siblings.size() != proof.positions.size() )
         return false;

      digest_type current = proof.leaf;
      for( size_t i = 0; i < proof.siblings.size(); ++i )
      {
         switch( proof.positions[i] )
         {
            case left:
               current = hash_pair( proof.siblings[i], current );
               break;
            case right:
               current = hash_pair( current, proof.siblings[i] );
               break;
            default:
               return false;
         }
      }
      return current == proof.root;
   }

   uint32_t merkle_tree::size()const
   {
      return _levels.empty() ? 0 : uint32_t( _levels.front().size() );
   }

   digest_type merkle_tree::root()const
   {
      if( _levels.empty() )
         return empty_root();
      return _levels.back().front();
   }

   const digest_type& merkle_tree::leaf( uint32_t position )const
   {
      FC_ASSERT( position < size(), "leaf ${p} out of range", ("p",position)("size",size()) );
      return _levels.front()[position];
   }

   vector<digest_type> merkle_tree::compute_path( const digest_type& leaf )const
   {
      vector<digest_type> path;
      path.push_back( leaf );

      uint32_t index = size();
      uint64_t width = uint64_t( size() ) + 1;
      for( uint32_t level = 0; width > 1; ++level )
      {
         // an odd index always has a complete left neighbour already in the tree,
         // an even index is the last node of its level and moves up unchanged
         if( index % 2 == 1 )
            path.push_back( hash_pair( _levels[level][index - 1], path.back() ) );
         else
            path.push_back( path.back() );

         index /= 2;
         width = ( width + 1 ) / 2;
      }
      return path;
   }

   uint32_t merkle_tree::append( const digest_type& leaf )
   {
      const uint32_t position = size();
      const vector<digest_type> path = compute_path( leaf );

      uint32_t index = position;
      for( size_t level = 0; level < path.size(); ++level )
      {
         if( level == _levels.size() )
            _levels.emplace_back();

         auto& nodes = _levels[level];
         if( index < nodes.size() )
            nodes[index] = path[level];
         else
            nodes.push_back( path[level] );

         index /= 2;
      }
      return position;
   }

   inclusion_proof merkle_tree::proof( uint32_t position )const
   {
      FC_ASSERT( position < size(), "leaf ${p} out of range", ("p",position)("size",size()) );

      inclusion_proof result;
      result.leaf = _levels.front()[position];

      uint32_t index = position;
      for( size_t level = 0; level + 1 < _levels.size(); ++level )
      {
         const auto& nodes = _levels[level];
         if( index % 2 == 1 )
         {
            result.siblings.push_back( nodes[index - 1] );
            result.positions.push_back( left );
         }
         else if( index + 1 < nodes.size() )
         {
            result.siblings.push_back( nodes[index + 1] );
            result.positions.push_back( right );
         }
         index /= 2;
      }

      result.root = root();
      return result;
   }

   void merkle_tree::clear()
   {
      _levels.clear();
   }

} } // vil::ledger
