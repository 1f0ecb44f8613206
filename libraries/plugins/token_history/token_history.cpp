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
#include <lazymint/token_history/token_history.hpp>

#include <fc/log/logger.hpp>

#include <boost/container/flat_set.hpp>
#include <boost/tuple/tuple.hpp>

#include <iterator>

namespace lazymint {
   namespace token_history {

      namespace detail {

         class token_history_impl {
         public:
            explicit token_history_impl(token_history &_plugin);

            virtual ~token_history_impl();

            void on_operation(const operation_history_object &entry);

            lazymint::chain::database &database() const {
               return _self.database();
            }

            friend class lazymint::token_history::token_history;

         private:
            void prune_token(token_id_type id);

            token_history &_self;

            uint32_t _max_entries_per_token = 0;

            token_history_multi_index_type _tokens;
            account_history_multi_index_type _accounts;
            object_id_type _next_account_entry = 0;

            boost::signals2::scoped_connection _applied_connection;
         };

         /// The token a notification concerns, if any
         struct operation_get_token {
            typedef optional<token_id_type> result_type;

            /** operator approvals and submitted operations concern no single token */
            template<typename T>
            optional<token_id_type> operator()(const T &) const {
               return optional<token_id_type>();
            }

            optional<token_id_type> operator()(const token_prepared_operation &op) const { return op.token_id; }
            optional<token_id_type> operator()(const token_minted_operation &op) const { return op.token_id; }
            optional<token_id_type> operator()(const royalty_updated_operation &op) const { return op.token_id; }
            optional<token_id_type> operator()(const ownership_transferred_operation &op) const { return op.token_id; }
            optional<token_id_type> operator()(const token_approval_operation &op) const { return op.token_id; }
         };

         struct operation_get_impacted_accounts {
            boost::container::flat_set<account_id_type> &_impacted;

            explicit operation_get_impacted_accounts(boost::container::flat_set<account_id_type> &impact)
               : _impacted(impact) {
            }

            typedef void result_type;

            /** do nothing for other operation types */
            template<typename T>
            void operator()(const T &) const {}

            void operator()(const token_prepared_operation &op) const {
               _impacted.insert(op.creator);
            }

            void operator()(const token_minted_operation &op) const {
               _impacted.insert(op.owner);
            }

            void operator()(const royalty_updated_operation &op) const {
               _impacted.insert(op.recipient);
            }

            void operator()(const ownership_transferred_operation &op) const {
               _impacted.insert(op.from);
               _impacted.insert(op.to);
            }

            void operator()(const token_approval_operation &op) const {
               _impacted.insert(op.owner);
               _impacted.insert(op.approved);
            }

            void operator()(const operator_approval_operation &op) const {
               _impacted.insert(op.owner);
               _impacted.insert(op.operator_account);
            }
         };

         token_history_impl::token_history_impl(token_history &_plugin)
            : _self(_plugin) {
         }

         token_history_impl::~token_history_impl() {
         }

         void token_history_impl::on_operation(const operation_history_object &entry) {
            const optional<token_id_type> token = entry.op.visit(operation_get_token());
            if (token.valid()) {
               token_history_object obj;
               obj.id = entry.id;
               obj.token_id = *token;
               obj.op = entry.op;
               _tokens.insert(std::move(obj));

               prune_token(*token);
            }

            boost::container::flat_set<account_id_type> impacted;
            entry.op.visit(operation_get_impacted_accounts(impacted));
            for (const account_id_type &account : impacted) {
               if (account.is_null()) {
                  continue;
               }
               account_history_object obj;
               obj.id = _next_account_entry++;
               obj.account = account;
               obj.sequence = entry.id;
               obj.op = entry.op;
               _accounts.insert(std::move(obj));
            }
         }

         void token_history_impl::prune_token(token_id_type id) {
            if (_max_entries_per_token == 0) {
               return;
            }

            auto &token_idx = _tokens.get<by_token_sequence>();
            auto range = token_idx.equal_range(boost::make_tuple(id));
            std::size_t count = std::distance(range.first, range.second);

            // Oldest entries are first
            auto itr = range.first;
            while (count > _max_entries_per_token) {
               dlog("Pruning notification ${seq} of token ${id}", ("seq", itr->id)("id", id));
               itr = token_idx.erase(itr);
               --count;
            }
         }

      } // end namespace detail

      token_history::token_history(lazymint::chain::database &db) :
         plugin(db),
         my(new detail::token_history_impl(*this)) {
      }

      token_history::~token_history() {
         cleanup();
      }

      std::string token_history::plugin_name() const {
         return "token_history";
      }

      std::string token_history::plugin_description() const {
         return "Indexes committed token notifications by token and by account";
      }

      void token_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("token-history-max-entries", boost::program_options::value<uint32_t>()->default_value(0),
             "Maximum number of notifications retained per token (0 retains every notification)");
         cfg.add(cli);
      }

      void token_history::plugin_initialize(const boost::program_options::variables_map &options) {
         my->_applied_connection = database().applied_operation.connect([this](const operation_history_object &entry) {
            my->on_operation(entry);
         });

         if (options.count("token-history-max-entries") > 0) {
            my->_max_entries_per_token = options["token-history-max-entries"].as<uint32_t>();
         }
      }

      void token_history::plugin_startup() {
         ilog("token_history: plugin_startup() begin");
      }

      void token_history::plugin_shutdown() {
         ilog("token_history: plugin_shutdown() begin");
         cleanup();
      }

      void token_history::cleanup() {
         my->_applied_connection.disconnect();
      }

      vector<token_history_object> token_history::get_token_history(const token_id_type id) const {
         vector<token_history_object> result;
         const auto &token_idx = my->_tokens.get<by_token_sequence>();
         auto range = token_idx.equal_range(boost::make_tuple(id));
         for (auto itr = range.first; itr != range.second; ++itr) {
            result.push_back(*itr);
         }
         return result;
      }

      vector<account_history_object> token_history::get_account_history(const account_id_type account) const {
         vector<account_history_object> result;
         const auto &account_idx = my->_accounts.get<by_account_sequence>();
         auto range = account_idx.equal_range(boost::make_tuple(account));
         for (auto itr = range.first; itr != range.second; ++itr) {
            result.push_back(*itr);
         }
         return result;
      }

      vector<token_id_type> token_history::get_tokens_by_creator(const account_id_type account) const {
         vector<token_id_type> result;
         const auto &account_idx = my->_accounts.get<by_account_sequence>();
         auto range = account_idx.equal_range(boost::make_tuple(account));
         for (auto itr = range.first; itr != range.second; ++itr) {
            if (itr->op.which() != operation::tag<token_prepared_operation>::value) {
               continue;
            }
            result.push_back(itr->op.get<token_prepared_operation>().token_id);
         }
         return result;
      }

      vector<royalty_updated_operation> token_history::get_royalty_updates(const token_id_type id) const {
         vector<royalty_updated_operation> result;
         const auto &token_idx = my->_tokens.get<by_token_sequence>();
         auto range = token_idx.equal_range(boost::make_tuple(id));
         for (auto itr = range.first; itr != range.second; ++itr) {
            if (itr->op.which() == operation::tag<royalty_updated_operation>::value) {
               result.push_back(itr->op.get<royalty_updated_operation>());
            }
         }
         return result;
      }

      uint32_t token_history::max_entries_per_token() const {
         return my->_max_entries_per_token;
      }

   }
} // lazymint::token_history
