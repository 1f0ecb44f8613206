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

#include <lazymint/chain/account_ownership_ledger.hpp>
#include <lazymint/chain/admin_gate.hpp>
#include <lazymint/chain/descriptor_store.hpp>
#include <lazymint/chain/evaluator.hpp>
#include <lazymint/chain/ledger_config.hpp>
#include <lazymint/chain/mint_gate.hpp>
#include <lazymint/chain/operation_history_object.hpp>
#include <lazymint/chain/royalty_ledger.hpp>
#include <lazymint/chain/token_registry.hpp>

#include <fc/signals.hpp>

#include <memory>
#include <vector>

namespace lazymint {
   namespace chain {

      /**
       *   @class database
       *   @brief tracks the state of the token ledger
       *
       *   Every submitted operation is applied inside its own undo session.  An operation either
       *   takes full effect or leaves no trace, including in the notification log.  Operations may
       *   be submitted while another is being applied, e.g. by a programmable account reacting to
       *   a transfer; they then become part of the enclosing operation.
       */
      class database {
      public:
         explicit database(const ledger_config &cfg = ledger_config());

         ~database();

         /**
          * @brief Apply a configuration to a ledger that has not been used yet
          */
         void open(const ledger_config &cfg);

         /**
          * @brief Validate, evaluate and apply a submitted operation
          * @return The new token ID for a prepare operation, otherwise void_result
          */
         operation_result apply_operation(const operation &op);

         /// @name Submission helpers
         /// @{
         token_id_type prepare(const account_id_type &creator, const string &descriptor);

         void set_royalty(const account_id_type &creator, token_id_type id,
                          const account_id_type &recipient, requested_basis_points_type basis_points);

         void transfer(const account_id_type &caller, const account_id_type &from,
                       const account_id_type &to, token_id_type id, const string &data = string());

         void approve(const account_id_type &owner, const account_id_type &approved, token_id_type id);

         void set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account,
                                   bool approved);

         void set_base_descriptor_path(const account_id_type &admin, const string &path);
         /// @}

         /// @name Queries
         /// @{
         bool is_minted(token_id_type id) const;

         /// @throws unknown_token
         account_id_type creator_of(token_id_type id) const;

         royalty_info_result royalty_info(token_id_type id, uint64_t sale_price) const;

         token_id_type current_token_id() const;

         optional<account_id_type> owner_of(token_id_type id) const;

         uint64_t balance_of(const account_id_type &owner) const;

         /// Descriptor prefixed with the base path in effect now
         /// @throws unknown_token
         string token_descriptor(token_id_type id) const;

         /// Committed notifications with a sequence at or beyond @p start
         vector<operation_history_object> get_applied_operations(object_id_type start = 0) const;
         /// @}

         void register_receiver(const account_id_type &account, std::shared_ptr<token_receiver> receiver);

         void unregister_receiver(const account_id_type &account);

         const token_registry &registry() const { return _registry; }
         token_registry &registry() { return _registry; }

         const royalty_ledger &royalties() const { return _royalties; }
         royalty_ledger &royalties() { return _royalties; }

         const ownership_ledger &ownership() const { return _ownership; }
         ownership_ledger &ownership() { return _ownership; }

         mint_gate &mint() { return _mint_gate; }

         const descriptor_store &descriptors() const { return _descriptors; }
         descriptor_store &descriptors() { return _descriptors; }

         const admin_gate &admin() const { return _admin; }

         const notification_log &notifications() const { return _log; }

         /// True while an operation is being applied
         bool is_applying() const { return _undo_db.depth() > 0; }

         /**
          *  This signal is emitted once for every notification of an operation after the outermost
          *  operation commits.  Notifications of failed operations are never emitted.
          */
         fc::signal<void(const operation_history_object &)> applied_operation;

      private:
         template<typename EvaluatorType>
         void register_evaluator() {
            const int type = operation::tag<typename EvaluatorType::operation_type>::value;
            if (_operation_evaluators.size() <= static_cast<std::size_t>(type)) {
               _operation_evaluators.resize(type + 1);
            }
            _operation_evaluators[type].reset(new op_evaluator_impl<EvaluatorType>());
         }

         void initialize_evaluators();

         operation_result evaluate_operation(const operation &op);

         void notify_applied_operations(object_id_type first);

         undo_database _undo_db;
         notification_log _log;

         token_registry _registry;
         royalty_ledger _royalties;
         account_ownership_ledger _ownership;
         mint_gate _mint_gate;
         base_path_descriptor_store _descriptors;
         single_admin_gate _admin;

         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;
      };

   }
} // lazymint::chain
