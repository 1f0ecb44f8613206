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

#include <lazymint/app/plugin.hpp>
#include <lazymint/chain/database.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace lazymint { namespace token_history {
using namespace chain;

/**
 * @brief A committed notification concerning one token
 *
 * The object ID is the sequence of the notification in the ledger's notification log.
 */
struct token_history_object : public object
{
   token_id_type token_id = 0;
   operation op;
};

/**
 * @brief A committed notification concerning one account
 */
struct account_history_object : public object
{
   account_id_type account;
   object_id_type sequence = 0;
   operation op;
};

namespace detail
{
    class token_history_impl;
}

class token_history : public lazymint::app::plugin
{
   public:
      explicit token_history(lazymint::chain::database& db);
      ~token_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get the notifications of a token
       * @param id Token ID
       * @return Notifications in the order they were committed, oldest first
       */
      vector<token_history_object> get_token_history(const token_id_type id) const;

      /**
       * @brief Get the notifications that concern an account
       * @param account Account ID
       * @return Notifications in the order they were committed, oldest first
       */
      vector<account_history_object> get_account_history(const account_id_type account) const;

      /**
       * @brief Get the tokens prepared by an account
       * @param account Creator
       * @return Token IDs in ascending order
       */
      vector<token_id_type> get_tokens_by_creator(const account_id_type account) const;

      /**
       * @brief Get the successive royalty terms of a token
       * @param id Token ID
       * @return Royalty updates, oldest first.  The last update is in effect.
       */
      vector<royalty_updated_operation> get_royalty_updates(const token_id_type id) const;

      /// Maximum number of notifications retained per token.  Zero retains every notification.
      uint32_t max_entries_per_token() const;

   private:
      void cleanup();
      std::unique_ptr<detail::token_history_impl> my;
};

struct by_token_sequence;
typedef multi_index_container <
   token_history_object,
   indexed_by<
      ordered_unique < tag < by_id>, member<object, object_id_type, &object::id>>,
      ordered_unique <tag<by_token_sequence>,
         composite_key< token_history_object,
            member<token_history_object, token_id_type, &token_history_object::token_id>,
            member<object, object_id_type, &object::id>
         >
      >
   >
> token_history_multi_index_type;

struct by_account_sequence;
typedef multi_index_container <
   account_history_object,
   indexed_by<
      ordered_unique < tag < by_id>, member<object, object_id_type, &object::id>>,
      ordered_unique <tag<by_account_sequence>,
         composite_key< account_history_object,
            member<account_history_object, account_id_type, &account_history_object::account>,
            member<account_history_object, object_id_type, &account_history_object::sequence>
         >
      >
   >
> account_history_multi_index_type;

} } //lazymint::token_history

FC_REFLECT_DERIVED( lazymint::token_history::token_history_object, (lazymint::db::object), (token_id)(op) )
FC_REFLECT_DERIVED( lazymint::token_history::account_history_object, (lazymint::db::object), (account)(sequence)(op) )
