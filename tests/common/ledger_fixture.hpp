/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <lazymint/chain/database.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <map>

using namespace lazymint::chain;

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
         fc::log_level(fc::log_level::all));                      \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL(std::string("Expected \"") +                  \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what));                                   \
      }                                                           \
   }                                                              \
}

#define LAZYMINT_REQUIRE_THROW( expr, exc_type )          \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAZYMINT_REQUIRE_THROW begin "        \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAZYMINT_REQUIRE_THROW end "          \
         << req_throw_info << std::endl;                  \
}

#define LAZYMINT_CHECK_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAZYMINT_CHECK_THROW begin "          \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAZYMINT_CHECK_THROW end "            \
         << req_throw_info << std::endl;                  \
}

#define ACTOR(name) \
   const lazymint::protocol::account_id_type name ## _id = create_account(BOOST_PP_STRINGIZE(name)); \
   (void)name ## _id;

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

/// Instance of the account that administers the ledger of every fixture
#define LAZYMINT_TEST_ADMIN_INSTANCE 999

namespace lazymint { namespace chain { namespace test {

/// Reaches the registry's internal mint path, which only the mint gate uses in production
struct token_registry_access {
   static void mark_minted(token_registry& registry, token_id_type id, const account_id_type& owner)
   {
      registry.mark_minted(id, owner);
   }
};

struct ledger_fixture {
   ledger_fixture();
   virtual ~ledger_fixture();

   static ledger_config default_config();

   /// Issue a fresh account.  Names are only used for diagnostics.
   account_id_type create_account(const string& name);

   const string& account_name(const account_id_type& account) const;

   /// Operations of the notifications recorded at or beyond @p start
   vector<operation> notifications_since(object_id_type start) const;

   /// Notifications of one type recorded at or beyond @p start
   template<typename T>
   vector<T> notifications_of_type(object_id_type start = 0) const
   {
      vector<T> result;
      for( const operation& op : notifications_since(start) )
      {
         if( op.which() == operation::tag<T>::value )
            result.push_back(op.get<T>());
      }
      return result;
   }

   /// Sequence the next notification will be recorded at
   object_id_type next_notification() const { return db.notifications().size(); }

   ledger_config config;
   database db;

   const account_id_type admin_id;

   /// Notifications delivered through database::applied_operation
   vector<operation_history_object> published;

private:
   uint64_t _next_account = 1;
   std::map<account_id_type, string> _account_names;
};

} } } // lazymint::chain::test
