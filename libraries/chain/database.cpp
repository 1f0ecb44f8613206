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
#include <lazymint/chain/database.hpp>
#include <lazymint/chain/token_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace lazymint {
   namespace chain {

      database::database(const ledger_config &cfg)
         : _log(_undo_db),
           _registry(_undo_db, _log),
           _royalties(_undo_db, _registry, _log),
           _ownership(_undo_db, _log),
           _mint_gate(_undo_db, _registry, _ownership),
           _descriptors(_undo_db, cfg.base_descriptor_path),
           _admin(cfg.admin_account) {
         initialize_evaluators();
      }

      void database::open(const ledger_config &cfg) {
         FC_ASSERT(!is_applying() && _log.size() == 0, "A ledger in use may not be reconfigured");

         _admin = single_admin_gate(cfg.admin_account);
         _descriptors.set_base_path(cfg.base_descriptor_path);

         ilog("Token ledger opened with administrator ${a} and descriptor base path '${p}'",
              ("a", cfg.admin_account)("p", cfg.base_descriptor_path));
      }

      database::~database() {
         applied_operation.disconnect_all_slots();
      }

      void database::initialize_evaluators() {
         _operation_evaluators.resize(operation::count());
         register_evaluator<token_prepare_evaluator>();
         register_evaluator<royalty_set_evaluator>();
         register_evaluator<token_transfer_evaluator>();
         register_evaluator<token_approve_evaluator>();
         register_evaluator<operator_set_evaluator>();
         register_evaluator<base_path_set_evaluator>();
      }

      operation_result database::evaluate_operation(const operation &op) {
         const int type = op.which();
         FC_ASSERT(static_cast<std::size_t>(type) < _operation_evaluators.size()
                   && _operation_evaluators[type] != nullptr,
                   "No registered evaluator for operation ${op}", ("op", op));
         return _operation_evaluators[type]->evaluate(*this, op, true);
      }

      operation_result database::apply_operation(const operation &op) {
         try {
            FC_ASSERT(!is_virtual_operation(op), "Virtual operations may not be submitted");
            operation_validate(op);

            const bool outermost = !is_applying();
            const object_id_type first = _log.size();

            auto session = _undo_db.start_undo_session();
            operation_result result = evaluate_operation(op);
            session.commit();

            if (outermost) {
               notify_applied_operations(first);
            }
            return result;
         } catch (const fc::exception &e) {
            wlog("Rejected operation ${op}: ${e}", ("op", op)("e", e.to_string()));
            throw;
         }
      }

      void database::notify_applied_operations(object_id_type first) {
         for (const operation_history_object &entry : _log.since(first)) {
            try {
               applied_operation(entry);
            } catch (const fc::exception &e) {
               // The operation is already committed
               elog("Subscriber failed on notification ${seq}: ${e}",
                    ("seq", entry.id)("e", e.to_detail_string()));
            } catch (const std::exception &e) {
               elog("Subscriber failed on notification ${seq}: ${e}",
                    ("seq", entry.id)("e", e.what()));
            }
         }
      }

      token_id_type database::prepare(const account_id_type &creator, const string &descriptor) {
         token_prepare_operation op;
         op.creator = creator;
         op.descriptor = descriptor;
         return apply_operation(op).get<token_id_type>();
      }

      void database::set_royalty(const account_id_type &creator, token_id_type id,
                                 const account_id_type &recipient, requested_basis_points_type basis_points) {
         royalty_set_operation op;
         op.creator = creator;
         op.token_id = id;
         op.recipient = recipient;
         op.basis_points = basis_points;
         apply_operation(op);
      }

      void database::transfer(const account_id_type &caller, const account_id_type &from,
                              const account_id_type &to, token_id_type id, const string &data) {
         token_transfer_operation op;
         op.caller = caller;
         op.from = from;
         op.to = to;
         op.token_id = id;
         op.data = data;
         apply_operation(op);
      }

      void database::approve(const account_id_type &owner, const account_id_type &approved, token_id_type id) {
         token_approve_operation op;
         op.owner = owner;
         op.approved = approved;
         op.token_id = id;
         apply_operation(op);
      }

      void database::set_approval_for_all(const account_id_type &owner, const account_id_type &operator_account,
                                          bool approved) {
         operator_set_operation op;
         op.owner = owner;
         op.operator_account = operator_account;
         op.approved = approved;
         apply_operation(op);
      }

      void database::set_base_descriptor_path(const account_id_type &admin, const string &path) {
         base_path_set_operation op;
         op.admin = admin;
         op.path = path;
         apply_operation(op);
      }

      bool database::is_minted(token_id_type id) const {
         return _registry.is_minted(id);
      }

      account_id_type database::creator_of(token_id_type id) const {
         return _registry.creator_of(id);
      }

      royalty_info_result database::royalty_info(token_id_type id, uint64_t sale_price) const {
         return _royalties.royalty_info(id, sale_price);
      }

      token_id_type database::current_token_id() const {
         return _registry.current_token_id();
      }

      optional<account_id_type> database::owner_of(token_id_type id) const {
         return _ownership.owner_of(id);
      }

      uint64_t database::balance_of(const account_id_type &owner) const {
         return _ownership.balance_of(owner);
      }

      string database::token_descriptor(token_id_type id) const {
         return _descriptors.resolve(_registry.descriptor_of(id));
      }

      vector<operation_history_object> database::get_applied_operations(object_id_type start) const {
         return _log.since(start);
      }

      void database::register_receiver(const account_id_type &account, std::shared_ptr<token_receiver> receiver) {
         _ownership.register_receiver(account, std::move(receiver));
      }

      void database::unregister_receiver(const account_id_type &account) {
         _ownership.unregister_receiver(account);
      }

   }
} // lazymint::chain
