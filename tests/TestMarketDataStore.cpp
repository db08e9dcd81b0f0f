#include "market/MarketDataStore.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace papertrade;
using market::CandleInterval;
using market::MarketDataCapacity;
using market::MarketDataStore;
using market::PriceResolution;

int main() {
    std::cout << "[TEST] Starting MarketDataStore Test..." << std::endl;

    // Empty store: absence, never zero
    {
        MarketDataStore store;
        assert(!store.latestPrice("BTC").has_value());
        assert(!store.pairPrice("BTC", "USD").has_value());
        assert(store.window("BTC", 10).empty());
        assert(store.candles("BTC", 10, CandleInterval::ONE_MINUTE).empty());
        assert(store.assets().empty());
    }

    // Per-asset eviction in the combined sequence
    {
        MarketDataCapacity capacity;
        capacity.raw_ticks = 3;
        MarketDataStore store(capacity);

        for (int i = 0; i < 5; ++i) {
            assert(store.ingest(PriceTick(1000 + i, "BTC", 100.0 + i)));
        }
        assert(store.ingest(PriceTick(2000, "ETH", 10.0)));

        assert(store.count("BTC", PriceResolution::RAW) == 3);
        assert(store.count("ETH", PriceResolution::RAW) == 1);

        auto btc = store.window("BTC", 10);
        assert(btc.size() == 3);
        assert(btc.front().price == 102.0);
        assert(btc.back().price == 104.0);

        // ETH is unaffected by BTC eviction
        for (int i = 0; i < 3; ++i) {
            store.ingest(PriceTick(3000 + i, "BTC", 200.0 + i));
        }
        assert(store.count("ETH", PriceResolution::RAW) == 1);
        assert(store.latestPrice("ETH").value() == 10.0);
        assert(store.latestPrice("BTC").value() == 202.0);

        auto last_two = store.window("BTC", 2);
        assert(last_two.size() == 2);
        assert(last_two[0].price == 201.0 && last_two[1].price == 202.0);
        assert(store.window("BTC", 0).empty());
    }

    // Invalid prices are rejected
    {
        MarketDataStore store;
        assert(!store.ingest(PriceTick(1, "BTC", 0.0)));
        assert(!store.ingest(PriceTick(1, "BTC", -5.0)));
        assert(!store.ingest(PriceTick(1, "BTC", std::numeric_limits<double>::quiet_NaN())));
        assert(!store.ingest(PriceTick(1, "BTC", std::numeric_limits<double>::infinity())));
        assert(store.count("BTC", PriceResolution::RAW) == 0);
        assert(!store.latestPrice("BTC").has_value());
    }

    // Pair pricing through the reference asset
    {
        MarketDataStore store;
        store.ingest(PriceTick(1, "BTC", 60000.0));
        store.ingest(PriceTick(1, "ETH", 3000.0));

        assert(store.pairPrice("BTC", "USD").value() == 60000.0);
        assert(std::fabs(store.pairPrice("USD", "ETH").value() - 1.0 / 3000.0) < 1e-15);
        assert(store.pairPrice("BTC", "ETH").value() == 20.0);
        assert(!store.pairPrice("BTC", "SOL").has_value());
        assert(!store.pairPrice("SOL", "ETH").has_value());
        assert(!store.pairPrice("USD", "SOL").has_value());
    }

    // Resolutions are separate tiers
    {
        MarketDataCapacity capacity;
        capacity.five_minute_points = 2;
        MarketDataStore store(capacity);

        store.ingest(PriceTick(1, "BTC", 1.0), PriceResolution::FIVE_MINUTE);
        store.ingest(PriceTick(2, "BTC", 2.0), PriceResolution::FIVE_MINUTE);
        store.ingest(PriceTick(3, "BTC", 3.0), PriceResolution::FIVE_MINUTE);

        assert(store.count("BTC", PriceResolution::FIVE_MINUTE) == 2);
        assert(store.count("BTC", PriceResolution::RAW) == 0);
        // latestPrice reads the raw tier only
        assert(!store.latestPrice("BTC").has_value());

        auto points = store.window("BTC", 5, PriceResolution::FIVE_MINUTE);
        assert(points.size() == 2 && points[0].price == 2.0 && points[1].price == 3.0);
    }

    // OHLC tiers
    {
        MarketDataCapacity capacity;
        capacity.one_minute_candles = 2;
        MarketDataStore store(capacity);

        for (int i = 0; i < 4; ++i) {
            assert(store.ingestOhlc(OhlcCandle(i * 60000, "BTC", 10.0 + i, 12.0 + i, 9.0 + i, 11.0 + i),
                                    CandleInterval::ONE_MINUTE));
        }
        assert(store.candleCount("BTC", CandleInterval::ONE_MINUTE) == 2);
        assert(store.candleCount("BTC", CandleInterval::FIVE_MINUTE) == 0);

        auto candles = store.candles("BTC", 10, CandleInterval::ONE_MINUTE);
        assert(candles.size() == 2);
        assert(candles[0].open == 12.0 && candles[1].close == 14.0);

        // low above high is malformed
        assert(!store.ingestOhlc(OhlcCandle(0, "BTC", 10.0, 9.0, 11.0, 10.0), CandleInterval::FIVE_MINUTE));
    }

    std::cout << "[TEST] MarketDataStore Test PASSED!" << std::endl;
    return 0;
}
