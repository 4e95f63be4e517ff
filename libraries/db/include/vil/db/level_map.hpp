#pragma once
#include <vil/db/level_database.hpp>
#include <vil/db/exception.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/io/raw.hpp>
#include <fc/exception/exception.hpp>

#include <fc/log/logger.hpp>

namespace vil { namespace db {

  /**
   *  @brief implements a typed table on top of a level_database that stores items using fc::raw / reflection
   *
   *  Keys are prefixed with the table id so that several tables can live in one
   *  database and be updated together through a write_batch.
   */
  template<typename Key, typename Value>
  class level_map
  {
     public:
        void open( level_database& database, uint8_t table_id )
        {
           FC_ASSERT( database.is_open() );
           _database = &database;
           _table_id = table_id;
        }

        void close()
        {
           _database = nullptr;
        }

        bool is_open()const { return _database != nullptr && _database->is_open(); }

        Value fetch( const Key& k )const
        {
          try {
             auto value = fetch_optional( k );
             if( !value.valid() )
             {
               FC_THROW_EXCEPTION( fc::key_not_found_exception, "unable to find key ${key}", ("key",k) );
             }
             return *value;
          } FC_RETHROW_EXCEPTIONS( warn, "error fetching key ${key}", ("key",k) );
        }

        fc::optional<Value> fetch_optional( const Key& k )const
        {
          try {
             FC_ASSERT( is_open() );
             auto value = _database->get( pack_key( k ) );
             if( !value.valid() )
                return fc::optional<Value>();

             fc::datastream<const char*> ds( value->c_str(), value->size() );
             Value tmp;
             fc::raw::unpack( ds, tmp );
             return tmp;
          } FC_RETHROW_EXCEPTIONS( warn, "error fetching key ${key}", ("key",k) );
        }

        bool contains( const Key& k )const
        {
           FC_ASSERT( is_open() );
           return _database->get( pack_key( k ) ).valid();
        }

        class iterator
        {
           public:
             iterator(){}
             bool valid()const
             {
                return _it && _it->Valid() && _it->key().size() > 0 && uint8_t(_it->key()[0]) == _table_id;
             }

             Key key()const
             {
                 Key tmp_key;
                 fc::datastream<const char*> ds2( _it->key().data() + 1, _it->key().size() - 1 );
                 fc::raw::unpack( ds2, tmp_key );
                 return tmp_key;
             }

             Value value()const
             {
               Value tmp_val;
               fc::datastream<const char*> ds( _it->value().data(), _it->value().size() );
               fc::raw::unpack( ds, tmp_val );
               return tmp_val;
             }

             iterator& operator++()    { _it->Next(); return *this; }

           protected:
             friend class level_map;
             iterator( ldb::Iterator* it, uint8_t table_id )
             :_it(it),_table_id(table_id){}

             std::shared_ptr<ldb::Iterator> _it;
             uint8_t                        _table_id = 0;
        };

        iterator begin()const
        { try {
           FC_ASSERT( is_open() );
           iterator itr( _database->new_iterator(), _table_id );
           const char prefix = char(_table_id);
           itr._it->Seek( ldb::Slice( &prefix, 1 ) );

           if( !itr._it->status().ok() )
           {
               FC_THROW_EXCEPTION( level_database_failure, "database error: ${msg}", ("msg", itr._it->status().ToString() ) );
           }

           if( itr.valid() )
           {
              return itr;
           }
           return iterator();
        } FC_RETHROW_EXCEPTIONS( warn, "error seeking to first" ) }

        void store( const Key& k, const Value& v )
        {
          try
          {
             FC_ASSERT( is_open() );
             _database->put( pack_key( k ), fc::raw::pack( v ) );
          } FC_RETHROW_EXCEPTIONS( warn, "error storing ${key} = ${value}", ("key",k)("value",v) );
        }

        /** stages the write; it becomes visible when the batch is written */
        void store( const Key& k, const Value& v, write_batch& batch )const
        {
           batch.put( pack_key( k ), fc::raw::pack( v ) );
        }

     private:
        std::vector<char> pack_key( const Key& k )const
        {
           std::vector<char> packed = fc::raw::pack( k );
           packed.insert( packed.begin(), char(_table_id) );
           return packed;
        }

        level_database* _database = nullptr;
        uint8_t         _table_id = 0;
  };

} } // vil::db
