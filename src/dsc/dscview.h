// Copyright (c) DeFi Blockchain Developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#ifndef DSC_DSC_DSCVIEW_H
#define DSC_DSC_DSCVIEW_H

#include <flushablestorage.h>
#include <dsc/collateral.h>
#include <dsc/history.h>
#include <dsc/loan.h>

/**
 * The engine ledger. The root view owns the backing store, a child view
 * stages the writes of one operation over its parent until Flush().
 */
class CDscView : public CCollateralView, public CLoanView, public CHistoryView
{
public:
    CDscView() : CStorageView(new CStorageKVMemory) {}
    explicit CDscView(CDscView& other) : CStorageView(new CFlushableStorageKV(other.DB())) {}
    CDscView(const CDscView&) = delete;
    CDscView& operator=(const CDscView&) = delete;
};

#endif // DSC_DSC_DSCVIEW_H
